#ifndef HARVESTER_JSON_PARSER_HPP
#define HARVESTER_JSON_PARSER_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace harvester {

// Minimal JSON reader for the flat objects exchanged with the chat gateway.
// Top-level members only: string values are unescaped, nested objects and
// arrays are returned as raw JSON text, numbers/booleans/null as their literal.
class JsonParser {
public:
    using Object = std::map<std::string, std::string>;

    static Object parse(const std::string& json);

    // Raw text of every object inside the array stored under `key`
    // (e.g. {"messages":[{...},{...}]}). Missing key or non-array yields {}.
    static std::vector<std::string> parseObjectArray(const std::string& json, const std::string& key);

    static std::vector<std::string> parseStringArray(const std::string& json);
    static std::string stringify(const Object& data);
    static std::string escapeJson(const std::string& str);
    static std::string unescapeJson(const std::string& str);

    // Typed accessors over a parsed object. "null" and missing keys are absent.
    static std::optional<std::string> getString(const Object& obj, const std::string& key);
    static int64_t getInt64(const Object& obj, const std::string& key, int64_t fallback = 0);
    static bool getBool(const Object& obj, const std::string& key, bool fallback = false);
};

} // namespace harvester

#endif // HARVESTER_JSON_PARSER_HPP
