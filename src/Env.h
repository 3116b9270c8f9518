#pragma once

#include <string>
#include <cstdlib>

inline std::string GetEnvVar(const char *name)
{
#ifdef _MSC_VER
    char *buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf)
    {
        std::string v(buf);
        free(buf);
        return v;
    }
    return std::string();
#else
    const char *v = std::getenv(name);
    return v ? std::string(v) : std::string();
#endif
}

// Integer value of an environment variable. Leaves out untouched when the
// variable is unset or not a plain (optionally signed) decimal number.
inline bool GetEnvInt(const char *name, long long &out)
{
    std::string v = GetEnvVar(name);
    if (v.empty())
        return false;
    char *end = nullptr;
    long long parsed = std::strtoll(v.c_str(), &end, 10);
    if (end == v.c_str() || *end != '\0')
        return false;
    out = parsed;
    return true;
}
