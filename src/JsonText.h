#pragma once
#include <functional>
#include <string>

// Small, lenient JSON helpers for the flat config files under assets/ and for
// the event payloads handed to the host UI. Not a general purpose parser.

std::string EscapeJson(const std::string &input);

// Quoted JSON string literal, eg "abc" -> "\"abc\"".
std::string QuoteJson(const std::string &input);

// Position of the brace closing the one at open_pos, or npos. Skips quoted strings.
std::string::size_type FindMatchingBrace(const std::string &text, std::string::size_type open_pos,
                                         char open_ch = '{', char close_ch = '}');

bool ExtractJsonStringField(const std::string &object, const char *field, std::string &out);
bool ExtractJsonBoolField(const std::string &object, const char *field, bool &out);

// Calls visit(key, raw_value) for every member of the top level object in text.
// Raw values are returned as written: quoted strings are unescaped, objects and
// arrays are passed through including their braces.
bool ForEachJsonMember(const std::string &text,
                       const std::function<void(const std::string &, const std::string &)> &visit);

// Calls visit(object_text) for every {...} element of the top level array in text.
bool ForEachJsonArrayObject(const std::string &text, const std::function<void(const std::string &)> &visit);

bool ReadTextFile(const std::string &path, std::string &out);
