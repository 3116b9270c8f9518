#include "JsonText.h"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace
{
void SkipSpace(const std::string &text, size_t &pos)
{
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
    ++pos;
}

bool ReadHex4(const std::string &text, size_t &pos, unsigned &out)
{
  if (pos + 4 > text.size())
    return false;
  out = 0;
  for (size_t i = 0; i < 4; ++i)
  {
    char c = text[pos + i];
    out <<= 4;
    if (c >= '0' && c <= '9')
      out |= static_cast<unsigned>(c - '0');
    else if (c >= 'a' && c <= 'f')
      out |= static_cast<unsigned>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      out |= static_cast<unsigned>(c - 'A' + 10);
    else
      return false;
  }
  pos += 4;
  return true;
}

void AppendUtf8(std::string &out, unsigned cp)
{
  if (cp < 0x80)
  {
    out.push_back(static_cast<char>(cp));
  }
  else if (cp < 0x800)
  {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  else if (cp < 0x10000)
  {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  else
  {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Decodes the four hex digits of a unicode escape at pos, joining a surrogate pair when one follows.
// Unpaired surrogates become U+FFFD.
bool ReadUnicodeEscape(const std::string &text, size_t &pos, std::string &out)
{
  unsigned cp = 0;
  if (!ReadHex4(text, pos, cp))
    return false;
  if (cp >= 0xD800 && cp <= 0xDBFF)
  {
    size_t next = pos;
    unsigned low = 0;
    if (next + 1 < text.size() && text[next] == '\\' && text[next + 1] == 'u')
    {
      next += 2;
      if (ReadHex4(text, next, low) && low >= 0xDC00 && low <= 0xDFFF)
      {
        pos = next;
        AppendUtf8(out, 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00));
        return true;
      }
    }
    cp = 0xFFFD;
  }
  else if (cp >= 0xDC00 && cp <= 0xDFFF)
  {
    cp = 0xFFFD;
  }
  AppendUtf8(out, cp);
  return true;
}

// Reads a quoted string starting at text[pos] == '"'. Leaves pos after the closing quote.
bool ReadQuoted(const std::string &text, size_t &pos, std::string &out)
{
  if (pos >= text.size() || text[pos] != '"')
    return false;
  ++pos;
  std::string value;
  bool escape = false;
  while (pos < text.size())
  {
    char c = text[pos++];
    if (escape)
    {
      escape = false;
      switch (c)
      {
      case 'n':
        value.push_back('\n');
        break;
      case 'r':
        value.push_back('\r');
        break;
      case 't':
        value.push_back('\t');
        break;
      case 'b':
        value.push_back('\b');
        break;
      case 'f':
        value.push_back('\f');
        break;
      case 'u':
        if (!ReadUnicodeEscape(text, pos, value))
          return false;
        break;
      default:
        value.push_back(c);
        break;
      }
      continue;
    }
    if (c == '\\')
    {
      escape = true;
      continue;
    }
    if (c == '"')
    {
      out = std::move(value);
      return true;
    }
    value.push_back(c);
  }
  return false;
}

// Reads one value (string, object, array or bare literal) at pos.
bool ReadRawValue(const std::string &text, size_t &pos, std::string &out)
{
  SkipSpace(text, pos);
  if (pos >= text.size())
    return false;
  char c = text[pos];
  if (c == '"')
    return ReadQuoted(text, pos, out);
  if (c == '{' || c == '[')
  {
    size_t close = FindMatchingBrace(text, pos, c, c == '{' ? '}' : ']');
    if (close == std::string::npos)
      return false;
    out = text.substr(pos, close - pos + 1);
    pos = close + 1;
    return true;
  }
  size_t end = text.find_first_of(",}]", pos);
  if (end == std::string::npos)
    end = text.size();
  out = text.substr(pos, end - pos);
  while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back())))
    out.pop_back();
  pos = end;
  return true;
}

bool FindFieldValue(const std::string &object, const char *field, size_t &pos)
{
  if (!field)
    return false;
  std::string needle = std::string("\"") + field + "\"";
  pos = object.find(needle);
  if (pos == std::string::npos)
    return false;
  pos = object.find(':', pos + needle.size());
  if (pos == std::string::npos)
    return false;
  ++pos;
  SkipSpace(object, pos);
  return pos < object.size();
}
} // namespace

std::string EscapeJson(const std::string &input)
{
  std::string out;
  out.reserve(input.size() + 8);
  for (char c : input)
  {
    switch (c)
    {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
      {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buf;
      }
      else
      {
        out += c;
      }
      break;
    }
  }
  return out;
}

std::string QuoteJson(const std::string &input)
{
  return "\"" + EscapeJson(input) + "\"";
}

std::string::size_type FindMatchingBrace(const std::string &text, std::string::size_type open_pos,
                                         char open_ch, char close_ch)
{
  size_t depth = 0;
  for (size_t i = open_pos; i < text.size(); ++i)
  {
    char c = text[i];
    if (c == open_ch)
      ++depth;
    else if (c == close_ch)
    {
      if (depth == 0)
        return std::string::npos;
      --depth;
      if (depth == 0)
        return i;
    }
    else if (c == '"')
    {
      ++i;
      bool escape = false;
      for (; i < text.size(); ++i)
      {
        char qc = text[i];
        if (escape)
        {
          escape = false;
          continue;
        }
        if (qc == '\\')
        {
          escape = true;
          continue;
        }
        if (qc == '"')
          break;
      }
    }
  }
  return std::string::npos;
}

bool ExtractJsonStringField(const std::string &object, const char *field, std::string &out)
{
  size_t pos = 0;
  if (!FindFieldValue(object, field, pos))
    return false;
  // Explicit null counts as absent
  if (object.compare(pos, 4, "null") == 0)
    return false;
  return ReadQuoted(object, pos, out);
}

bool ExtractJsonBoolField(const std::string &object, const char *field, bool &out)
{
  size_t pos = 0;
  if (!FindFieldValue(object, field, pos))
    return false;
  if (object.compare(pos, 4, "true") == 0 || object[pos] == '1')
  {
    out = true;
    return true;
  }
  if (object.compare(pos, 5, "false") == 0 || object[pos] == '0')
  {
    out = false;
    return true;
  }
  return false;
}

bool ForEachJsonMember(const std::string &text,
                       const std::function<void(const std::string &, const std::string &)> &visit)
{
  size_t open = text.find('{');
  if (open == std::string::npos)
    return false;
  size_t close = FindMatchingBrace(text, open);
  if (close == std::string::npos)
    return false;

  size_t pos = open + 1;
  while (pos < close)
  {
    SkipSpace(text, pos);
    if (pos >= close)
      break;
    if (text[pos] == ',')
    {
      ++pos;
      continue;
    }
    std::string key;
    if (!ReadQuoted(text, pos, key))
      return false;
    SkipSpace(text, pos);
    if (pos >= close || text[pos] != ':')
      return false;
    ++pos;
    std::string value;
    if (!ReadRawValue(text, pos, value))
      return false;
    visit(key, value);
  }
  return true;
}

bool ForEachJsonArrayObject(const std::string &text, const std::function<void(const std::string &)> &visit)
{
  size_t open = text.find('[');
  if (open == std::string::npos)
    return false;
  size_t close = FindMatchingBrace(text, open, '[', ']');
  if (close == std::string::npos)
    return false;

  size_t pos = open + 1;
  while (pos < close)
  {
    size_t obj_open = text.find('{', pos);
    if (obj_open == std::string::npos || obj_open > close)
      break;
    size_t obj_close = FindMatchingBrace(text, obj_open);
    if (obj_close == std::string::npos)
      return false;
    visit(text.substr(obj_open, obj_close - obj_open + 1));
    pos = obj_close + 1;
  }
  return true;
}

bool ReadTextFile(const std::string &path, std::string &out)
{
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open())
    return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}
