//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Draft-07 subset schema checking and instance validation
//==========================================================================================================

#include "mcpws/validation/SchemaValidator.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <memory>
#include <mutex>
#include <regex>
#include <unordered_map>
#include <unordered_set>

#include "mcpws/errors/Errors.h"

namespace mcpws {
namespace validation {

namespace {

const std::unordered_set<std::string> kTypeNames = {
    "null", "boolean", "object", "array", "number", "string", "integer"
};

//------------------------------ Value helpers ------------------------------
bool isNumber(const JSONValue& v) {
    return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
}

double asDouble(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return static_cast<double>(std::get<int64_t>(v.value));
    return std::get<double>(v.value);
}

bool isIntegral(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return true;
    if (std::holds_alternative<double>(v.value)) {
        double d = std::get<double>(v.value);
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

bool isNonNegativeInteger(const JSONValue& v) {
    return isIntegral(v) && asDouble(v) >= 0.0;
}

bool matchesType(const JSONValue& inst, const std::string& t) {
    if (t == "null") return std::holds_alternative<std::nullptr_t>(inst.value);
    if (t == "boolean") return std::holds_alternative<bool>(inst.value);
    if (t == "object") return std::holds_alternative<JSONValue::Object>(inst.value);
    if (t == "array") return std::holds_alternative<JSONValue::Array>(inst.value);
    if (t == "string") return std::holds_alternative<std::string>(inst.value);
    if (t == "number") return isNumber(inst);
    if (t == "integer") return isIntegral(inst);
    return false;
}

// Python-style rendering used in messages: strings single-quoted, everything else as JSON.
std::string repr(const JSONValue& v) {
    if (std::holds_alternative<std::string>(v.value)) {
        return "'" + std::get<std::string>(v.value) + "'";
    }
    return SerializeJSON(v);
}

std::size_t codePointLength(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string escapePointerToken(const std::string& token) {
    std::string out;
    for (char c : token) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out.push_back(c);
    }
    return out;
}

const JSONValue* member(const JSONValue::Object& o, const char* key) {
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

//------------------------------ Regex cache ------------------------------
std::shared_ptr<const std::regex> compilePattern(const std::string& pattern) {
    static std::mutex mtx;
    static std::unordered_map<std::string, std::shared_ptr<const std::regex>> cache;
    std::lock_guard<std::mutex> lk(mtx);
    auto it = cache.find(pattern);
    if (it != cache.end()) return it->second;
    auto re = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    cache.emplace(pattern, re);
    return re;
}

bool checkFormat(const std::string& format, const std::string& s) {
    static const std::regex email(R"(^[^@\s]+@[^@\s]+\.[^@\s]+$)");
    static const std::regex date(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    static const std::regex dateTime(R"(^(\d{4})-(\d{2})-(\d{2})[Tt](\d{2}):(\d{2}):(\d{2})(\.\d+)?([Zz]|[+-]\d{2}:\d{2})$)");
    static const std::regex uri(R"(^[A-Za-z][A-Za-z0-9+.\-]*:[^\s]*$)");
    static const std::regex uuid(R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)");

    auto validYmd = [](const std::smatch& m) {
        int month = std::stoi(m[2].str());
        int day = std::stoi(m[3].str());
        return month >= 1 && month <= 12 && day >= 1 && day <= 31;
    };

    std::smatch m;
    if (format == "email") return std::regex_match(s, email);
    if (format == "uri") return std::regex_match(s, uri);
    if (format == "uuid") return std::regex_match(s, uuid);
    if (format == "date") return std::regex_match(s, m, date) && validYmd(m);
    if (format == "date-time") {
        if (!std::regex_match(s, m, dateTime) || !validYmd(m)) return false;
        int hour = std::stoi(m[4].str());
        int minute = std::stoi(m[5].str());
        int second = std::stoi(m[6].str());
        return hour <= 23 && minute <= 59 && second <= 60;
    }
    // Unknown formats are annotations only
    return true;
}

//------------------------------ Schema checking ------------------------------
[[noreturn]] void schemaFail(const std::string& where, const std::string& what) {
    throw errors::InvalidSchemaError(std::format("Invalid schema at {}: {}", where, what));
}

void checkSchemaAt(const JSONValue& s, const std::string& where);

void checkSchemaArray(const JSONValue& v, const std::string& where, bool allowEmpty) {
    if (!std::holds_alternative<JSONValue::Array>(v.value)) schemaFail(where, "expected an array of schemas");
    const auto& arr = std::get<JSONValue::Array>(v.value);
    if (!allowEmpty && arr.empty()) schemaFail(where, "array must not be empty");
    for (std::size_t k = 0; k < arr.size(); ++k) {
        if (!arr[k]) schemaFail(where, "null entry");
        checkSchemaAt(*arr[k], where + "/" + std::to_string(k));
    }
}

void checkSchemaAt(const JSONValue& s, const std::string& where) {
    if (std::holds_alternative<bool>(s.value)) return;
    if (!std::holds_alternative<JSONValue::Object>(s.value)) {
        schemaFail(where, std::format("{} is not of type 'object', 'boolean'", repr(s)));
    }
    const auto& o = std::get<JSONValue::Object>(s.value);

    if (const JSONValue* t = member(o, "type")) {
        if (std::holds_alternative<std::string>(t->value)) {
            if (kTypeNames.count(std::get<std::string>(t->value)) == 0) {
                schemaFail(where + "/type", std::format("{} is not a valid type", repr(*t)));
            }
        } else if (std::holds_alternative<JSONValue::Array>(t->value)) {
            const auto& arr = std::get<JSONValue::Array>(t->value);
            if (arr.empty()) schemaFail(where + "/type", "type array must not be empty");
            std::unordered_set<std::string> seen;
            for (const auto& e : arr) {
                if (!e || !std::holds_alternative<std::string>(e->value) ||
                    kTypeNames.count(std::get<std::string>(e->value)) == 0) {
                    schemaFail(where + "/type", "type array entries must be valid type names");
                }
                if (!seen.insert(std::get<std::string>(e->value)).second) {
                    schemaFail(where + "/type", "type array entries must be unique");
                }
            }
        } else {
            schemaFail(where + "/type", std::format("{} is not of type 'string', 'array'", repr(*t)));
        }
    }

    if (const JSONValue* p = member(o, "properties")) {
        if (!std::holds_alternative<JSONValue::Object>(p->value)) {
            schemaFail(where + "/properties", "expected an object");
        }
        for (const auto& [name, sub] : std::get<JSONValue::Object>(p->value)) {
            if (!sub) schemaFail(where + "/properties/" + name, "null schema");
            checkSchemaAt(*sub, where + "/properties/" + escapePointerToken(name));
        }
    }

    if (const JSONValue* r = member(o, "required")) {
        if (!std::holds_alternative<JSONValue::Array>(r->value)) {
            schemaFail(where + "/required", std::format("{} is not of type 'array'", repr(*r)));
        }
        std::unordered_set<std::string> seen;
        for (const auto& e : std::get<JSONValue::Array>(r->value)) {
            if (!e || !std::holds_alternative<std::string>(e->value)) {
                schemaFail(where + "/required", "entries must be strings");
            }
            if (!seen.insert(std::get<std::string>(e->value)).second) {
                schemaFail(where + "/required", "entries must be unique");
            }
        }
    }

    for (const char* key : {"additionalProperties", "additionalItems", "not"}) {
        if (const JSONValue* sub = member(o, key)) {
            checkSchemaAt(*sub, where + "/" + key);
        }
    }

    if (const JSONValue* items = member(o, "items")) {
        if (std::holds_alternative<JSONValue::Array>(items->value)) {
            checkSchemaArray(*items, where + "/items", true);
        } else {
            checkSchemaAt(*items, where + "/items");
        }
    }

    for (const char* key : {"allOf", "anyOf", "oneOf"}) {
        if (const JSONValue* arr = member(o, key)) {
            checkSchemaArray(*arr, where + "/" + key, false);
        }
    }

    for (const char* key : {"minLength", "maxLength", "minItems", "maxItems", "minProperties", "maxProperties"}) {
        if (const JSONValue* v = member(o, key)) {
            if (!isNonNegativeInteger(*v)) {
                schemaFail(where + "/" + key, std::format("{} is not a non-negative integer", repr(*v)));
            }
        }
    }

    for (const char* key : {"minimum", "maximum", "exclusiveMinimum", "exclusiveMaximum"}) {
        if (const JSONValue* v = member(o, key)) {
            if (!isNumber(*v)) schemaFail(where + "/" + key, std::format("{} is not of type 'number'", repr(*v)));
        }
    }

    if (const JSONValue* v = member(o, "multipleOf")) {
        if (!isNumber(*v) || asDouble(*v) <= 0.0) {
            schemaFail(where + "/multipleOf", std::format("{} must be a number greater than 0", repr(*v)));
        }
    }

    if (const JSONValue* v = member(o, "pattern")) {
        if (!std::holds_alternative<std::string>(v->value)) {
            schemaFail(where + "/pattern", "expected a string");
        }
        try {
            (void)compilePattern(std::get<std::string>(v->value));
        } catch (const std::regex_error& e) {
            schemaFail(where + "/pattern", std::format("{} is not a valid regular expression ({})", repr(*v), e.what()));
        }
    }

    if (const JSONValue* v = member(o, "format")) {
        if (!std::holds_alternative<std::string>(v->value)) schemaFail(where + "/format", "expected a string");
    }

    if (const JSONValue* v = member(o, "enum")) {
        if (!std::holds_alternative<JSONValue::Array>(v->value)) {
            schemaFail(where + "/enum", std::format("{} is not of type 'array'", repr(*v)));
        }
    }

    if (const JSONValue* v = member(o, "uniqueItems")) {
        if (!std::holds_alternative<bool>(v->value)) schemaFail(where + "/uniqueItems", "expected a boolean");
    }

    for (const char* key : {"title", "description", "$comment", "$id", "$schema"}) {
        if (const JSONValue* v = member(o, key)) {
            if (!std::holds_alternative<std::string>(v->value)) {
                schemaFail(where + "/" + key, std::format("{} is not of type 'string'", repr(*v)));
            }
        }
    }
}

//------------------------------ Instance validation ------------------------------
class Walker {
public:
    explicit Walker(std::vector<ValidationIssue>& out) : out_(out) {}

    void validate(const JSONValue& schema, const JSONValue& inst, const std::string& path) {
        if (std::holds_alternative<bool>(schema.value)) {
            if (!std::get<bool>(schema.value)) {
                add(path, "false", std::format("False schema does not allow {}", repr(inst)));
            }
            return;
        }
        if (!std::holds_alternative<JSONValue::Object>(schema.value)) return;
        const auto& o = std::get<JSONValue::Object>(schema.value);

        if (const JSONValue* t = member(o, "type")) {
            if (!typeMatches(*t, inst)) {
                add(path, "type", std::format("{} is not of type {}", repr(inst), typeList(*t)));
                // Further keywords would only add noise for a mistyped value
                return;
            }
        }

        if (const JSONValue* e = member(o, "enum")) {
            const auto& arr = std::get<JSONValue::Array>(e->value);
            bool found = std::any_of(arr.begin(), arr.end(), [&](const std::shared_ptr<JSONValue>& c) {
                return c && JsonEquals(*c, inst);
            });
            if (!found) add(path, "enum", std::format("{} is not one of {}", repr(inst), SerializeJSON(*e)));
        }

        if (const JSONValue* c = member(o, "const")) {
            if (!JsonEquals(*c, inst)) add(path, "const", std::format("{} was expected", repr(*c)));
        }

        if (isNumber(inst)) validateNumber(o, inst, path);
        if (std::holds_alternative<std::string>(inst.value)) validateString(o, std::get<std::string>(inst.value), inst, path);
        if (std::holds_alternative<JSONValue::Array>(inst.value)) validateArray(o, std::get<JSONValue::Array>(inst.value), inst, path);
        if (std::holds_alternative<JSONValue::Object>(inst.value)) validateObject(o, std::get<JSONValue::Object>(inst.value), inst, path);

        validateCombinators(o, inst, path);
    }

private:
    std::vector<ValidationIssue>& out_;

    void add(const std::string& path, const char* keyword, std::string message) {
        out_.push_back(ValidationIssue{path, keyword, std::move(message)});
    }

    static bool typeMatches(const JSONValue& t, const JSONValue& inst) {
        if (std::holds_alternative<std::string>(t.value)) {
            return matchesType(inst, std::get<std::string>(t.value));
        }
        for (const auto& e : std::get<JSONValue::Array>(t.value)) {
            if (e && matchesType(inst, std::get<std::string>(e->value))) return true;
        }
        return false;
    }

    static std::string typeList(const JSONValue& t) {
        if (std::holds_alternative<std::string>(t.value)) return repr(t);
        std::string out;
        for (const auto& e : std::get<JSONValue::Array>(t.value)) {
            if (!out.empty()) out += ", ";
            out += repr(*e);
        }
        return out;
    }

    void validateNumber(const JSONValue::Object& o, const JSONValue& inst, const std::string& path) {
        const double v = asDouble(inst);
        if (const JSONValue* m = member(o, "minimum"); m && v < asDouble(*m)) {
            add(path, "minimum", std::format("{} is less than the minimum of {}", repr(inst), repr(*m)));
        }
        if (const JSONValue* m = member(o, "maximum"); m && v > asDouble(*m)) {
            add(path, "maximum", std::format("{} is greater than the maximum of {}", repr(inst), repr(*m)));
        }
        if (const JSONValue* m = member(o, "exclusiveMinimum"); m && v <= asDouble(*m)) {
            add(path, "exclusiveMinimum", std::format("{} is less than or equal to the minimum of {}", repr(inst), repr(*m)));
        }
        if (const JSONValue* m = member(o, "exclusiveMaximum"); m && v >= asDouble(*m)) {
            add(path, "exclusiveMaximum", std::format("{} is greater than or equal to the maximum of {}", repr(inst), repr(*m)));
        }
        if (const JSONValue* m = member(o, "multipleOf")) {
            bool ok;
            if (std::holds_alternative<int64_t>(inst.value) && std::holds_alternative<int64_t>(m->value)) {
                ok = std::get<int64_t>(inst.value) % std::get<int64_t>(m->value) == 0;
            } else {
                const double q = v / asDouble(*m);
                ok = std::isfinite(q) && std::fabs(q - std::round(q)) < 1e-9;
            }
            if (!ok) add(path, "multipleOf", std::format("{} is not a multiple of {}", repr(inst), repr(*m)));
        }
    }

    void validateString(const JSONValue::Object& o, const std::string& s, const JSONValue& inst, const std::string& path) {
        const std::size_t len = codePointLength(s);
        if (const JSONValue* m = member(o, "minLength"); m && static_cast<double>(len) < asDouble(*m)) {
            add(path, "minLength", std::format("{} is too short", repr(inst)));
        }
        if (const JSONValue* m = member(o, "maxLength"); m && static_cast<double>(len) > asDouble(*m)) {
            add(path, "maxLength", std::format("{} is too long", repr(inst)));
        }
        if (const JSONValue* p = member(o, "pattern")) {
            const auto& pattern = std::get<std::string>(p->value);
            if (!std::regex_search(s, *compilePattern(pattern))) {
                add(path, "pattern", std::format("{} does not match {}", repr(inst), repr(*p)));
            }
        }
        if (const JSONValue* f = member(o, "format")) {
            const auto& format = std::get<std::string>(f->value);
            if (!checkFormat(format, s)) {
                add(path, "format", std::format("{} is not a {}", repr(inst), repr(*f)));
            }
        }
    }

    void validateArray(const JSONValue::Object& o, const JSONValue::Array& arr, const JSONValue& inst, const std::string& path) {
        if (const JSONValue* m = member(o, "minItems"); m && static_cast<double>(arr.size()) < asDouble(*m)) {
            add(path, "minItems", std::format("{} is too short", repr(inst)));
        }
        if (const JSONValue* m = member(o, "maxItems"); m && static_cast<double>(arr.size()) > asDouble(*m)) {
            add(path, "maxItems", std::format("{} is too long", repr(inst)));
        }
        if (const JSONValue* u = member(o, "uniqueItems"); u && std::get<bool>(u->value)) {
            bool dup = false;
            for (std::size_t a = 0; a < arr.size() && !dup; ++a) {
                for (std::size_t b = a + 1; b < arr.size(); ++b) {
                    if (arr[a] && arr[b] && JsonEquals(*arr[a], *arr[b])) { dup = true; break; }
                }
            }
            if (dup) add(path, "uniqueItems", std::format("{} has non-unique elements", repr(inst)));
        }
        if (const JSONValue* items = member(o, "items")) {
            if (std::holds_alternative<JSONValue::Array>(items->value)) {
                const auto& tuple = std::get<JSONValue::Array>(items->value);
                for (std::size_t k = 0; k < arr.size() && k < tuple.size(); ++k) {
                    if (arr[k]) validate(*tuple[k], *arr[k], path + "/" + std::to_string(k));
                }
                if (arr.size() > tuple.size()) {
                    if (const JSONValue* extra = member(o, "additionalItems")) {
                        for (std::size_t k = tuple.size(); k < arr.size(); ++k) {
                            if (arr[k]) validate(*extra, *arr[k], path + "/" + std::to_string(k));
                        }
                    }
                }
            } else {
                for (std::size_t k = 0; k < arr.size(); ++k) {
                    if (arr[k]) validate(*items, *arr[k], path + "/" + std::to_string(k));
                }
            }
        }
    }

    void validateObject(const JSONValue::Object& o, const JSONValue::Object& obj, const JSONValue& inst, const std::string& path) {
        if (const JSONValue* r = member(o, "required")) {
            for (const auto& e : std::get<JSONValue::Array>(r->value)) {
                const auto& name = std::get<std::string>(e->value);
                if (obj.find(name) == obj.end()) {
                    add(path, "required", std::format("'{}' is a required property", name));
                }
            }
        }
        if (const JSONValue* m = member(o, "minProperties"); m && static_cast<double>(obj.size()) < asDouble(*m)) {
            add(path, "minProperties", std::format("{} does not have enough properties", repr(inst)));
        }
        if (const JSONValue* m = member(o, "maxProperties"); m && static_cast<double>(obj.size()) > asDouble(*m)) {
            add(path, "maxProperties", std::format("{} has too many properties", repr(inst)));
        }

        const JSONValue* props = member(o, "properties");
        const JSONValue::Object* propSchemas = props ? &std::get<JSONValue::Object>(props->value) : nullptr;
        if (propSchemas) {
            for (const auto& [name, sub] : *propSchemas) {
                auto it = obj.find(name);
                if (it != obj.end() && it->second) {
                    validate(*sub, *it->second, path + "/" + escapePointerToken(name));
                }
            }
        }

        if (const JSONValue* extra = member(o, "additionalProperties")) {
            std::vector<std::string> unexpected;
            for (const auto& [name, val] : obj) {
                if (propSchemas && propSchemas->find(name) != propSchemas->end()) continue;
                if (std::holds_alternative<bool>(extra->value)) {
                    if (!std::get<bool>(extra->value)) unexpected.push_back(name);
                } else if (val) {
                    validate(*extra, *val, path + "/" + escapePointerToken(name));
                }
            }
            if (!unexpected.empty()) {
                std::sort(unexpected.begin(), unexpected.end());
                std::string names;
                for (const auto& n : unexpected) {
                    if (!names.empty()) names += ", ";
                    names += "'" + n + "'";
                }
                add(path, "additionalProperties",
                    std::format("Additional properties are not allowed ({} {} unexpected)", names,
                                unexpected.size() == 1 ? "was" : "were"));
            }
        }
    }

    void validateCombinators(const JSONValue::Object& o, const JSONValue& inst, const std::string& path) {
        if (const JSONValue* all = member(o, "allOf")) {
            for (const auto& sub : std::get<JSONValue::Array>(all->value)) {
                validate(*sub, inst, path);
            }
        }
        if (const JSONValue* any = member(o, "anyOf")) {
            const auto& arr = std::get<JSONValue::Array>(any->value);
            bool ok = std::any_of(arr.begin(), arr.end(), [&](const std::shared_ptr<JSONValue>& sub) {
                return SchemaValidator::IsValid(*sub, inst);
            });
            if (!ok) add(path, "anyOf", std::format("{} is not valid under any of the given schemas", repr(inst)));
        }
        if (const JSONValue* one = member(o, "oneOf")) {
            const auto& arr = std::get<JSONValue::Array>(one->value);
            auto matches = std::count_if(arr.begin(), arr.end(), [&](const std::shared_ptr<JSONValue>& sub) {
                return SchemaValidator::IsValid(*sub, inst);
            });
            if (matches == 0) {
                add(path, "oneOf", std::format("{} is not valid under any of the given schemas", repr(inst)));
            } else if (matches > 1) {
                add(path, "oneOf", std::format("{} is valid under each of {} of the given schemas", repr(inst), matches));
            }
        }
        if (const JSONValue* n = member(o, "not")) {
            if (SchemaValidator::IsValid(*n, inst)) {
                add(path, "not", std::format("{} should not be valid under {}", repr(inst), SerializeJSON(*n)));
            }
        }
    }
};

} // namespace

bool JsonEquals(const JSONValue& a, const JSONValue& b) {
    if (isNumber(a) && isNumber(b)) {
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        return asDouble(a) == asDouble(b);
    }
    if (a.value.index() != b.value.index()) return false;
    if (std::holds_alternative<std::nullptr_t>(a.value)) return true;
    if (std::holds_alternative<bool>(a.value)) return std::get<bool>(a.value) == std::get<bool>(b.value);
    if (std::holds_alternative<std::string>(a.value)) return std::get<std::string>(a.value) == std::get<std::string>(b.value);
    if (std::holds_alternative<JSONValue::Array>(a.value)) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t k = 0; k < x.size(); ++k) {
            if (!x[k] || !y[k]) {
                if (x[k] != y[k]) return false;
                continue;
            }
            if (!JsonEquals(*x[k], *y[k])) return false;
        }
        return true;
    }
    const auto& x = std::get<JSONValue::Object>(a.value);
    const auto& y = std::get<JSONValue::Object>(b.value);
    if (x.size() != y.size()) return false;
    for (const auto& [key, val] : x) {
        auto it = y.find(key);
        if (it == y.end()) return false;
        if (!val || !it->second) {
            if (val != it->second) return false;
            continue;
        }
        if (!JsonEquals(*val, *it->second)) return false;
    }
    return true;
}

void SchemaValidator::CheckSchema(const JSONValue& schema) {
    checkSchemaAt(schema, "#");
}

std::vector<ValidationIssue> SchemaValidator::Validate(const JSONValue& schema, const JSONValue& instance) {
    std::vector<ValidationIssue> issues;
    Walker w(issues);
    w.validate(schema, instance, "");
    return issues;
}

bool SchemaValidator::IsValid(const JSONValue& schema, const JSONValue& instance) {
    return Validate(schema, instance).empty();
}

} // namespace validation
} // namespace mcpws
