#ifndef TEXT_REWRITE_H
#define TEXT_REWRITE_H

#include <string>

// Integer, decimal or exponential literal with an optional sign.
extern const char kNumericLiteralPattern[];

std::string EscapeRegex(const std::string& text);

// Replaces the numeric literal following "<indent><name><whitespace>" on every
// matching line. The name, the whitespace and the rest of the line are kept,
// as are line endings. count receives the number of lines rewritten.
std::string SubstituteParameterValue(const std::string& content,
                                     const std::string& name,
                                     const std::string& value,
                                     int* count = nullptr);

// Replaces the value following "<indent><field><whitespace>" up to the end of
// the line (a trailing '\r' is kept). Works on raw bytes: nothing outside the
// replaced value is touched, whatever its encoding.
std::string SubstitutePathField(const std::string& bytes,
                                const std::string& field,
                                const std::string& value,
                                int* count = nullptr);

#endif  // TEXT_REWRITE_H
