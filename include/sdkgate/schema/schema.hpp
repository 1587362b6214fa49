#pragma once

#include <sdkgate/log/macros.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgate {

/// Data-document model used across the gateway
using json = nlohmann::json;

} // namespace sdkgate

namespace sdkgate::schema {

/// Malformed interface description
class schema_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// One callable entry of the interface description
struct call_descriptor {
    std::string name;
    json arg_type;                              ///< Inline struct: argument name -> type
    json ret_type;                              ///< Return type expression
    std::vector<std::string> declared_errors;   ///< Declared-throws set, may be empty

    /// True if the error type may leave the call unchanged
    bool declares(std::string_view type) const {
        return std::find(declared_errors.begin(), declared_errors.end(), type) != declared_errors.end();
    }
};

/// Read-only interface description consumed by the dispatcher
class schema {
public:
    virtual ~schema() = default;

    /// Call entry by name, nullptr if the schema has none
    virtual const call_descriptor* lookup_call(std::string_view name) const = 0;

    /// Named types: struct objects, enum string arrays and alias strings
    virtual const json& type_table() const = 0;

    /// The full description as served on /ast.json
    virtual const json& description() const = 0;
};

/// Schema backed by a compiled AST data document
///
/// Expected layout:
/// @code
/// {
///   "typeTable":     { "User": {"name": "string"}, "Color": ["red"], "Id": "uuid" },
///   "functionTable": { "getUser": { "args": {"id": "Id"}, "ret": "User?" } },
///   "errors":        [ "NotFound", "Fatal" ],
///   "annotations":   { "fn.getUser": [ {"type": "throws", "value": "NotFound"} ] }
/// }
/// @endcode
class ast_schema : public schema {
public:
    static std::shared_ptr<ast_schema> from_json(json doc) {
        if (!doc.is_object()) {
            throw schema_error("AST document must be an object");
        }

        auto result = std::shared_ptr<ast_schema>(new ast_schema());

        if (doc.contains("typeTable")) {
            const auto& types = doc["typeTable"];
            if (!types.is_object()) {
                throw schema_error("typeTable must be an object");
            }
            for (const auto& [name, def] : types.items()) {
                check_type_definition(name, def);
            }
        } else {
            doc["typeTable"] = json::object();
        }

        if (doc.contains("errors")) {
            const auto& errors = doc["errors"];
            if (!errors.is_array()) {
                throw schema_error("errors must be an array");
            }
            for (const auto& error : errors) {
                // Plain names, or [name, dataType] pairs
                if (error.is_string()) {
                    result->errors_.push_back(error.get<std::string>());
                } else if (error.is_array() && !error.empty() && error[0].is_string()) {
                    result->errors_.push_back(error[0].get<std::string>());
                } else {
                    throw schema_error("errors entries must be names");
                }
            }
        }

        json annotations = json::object();
        if (doc.contains("annotations")) {
            annotations = doc["annotations"];
            if (!annotations.is_object()) {
                throw schema_error("annotations must be an object");
            }
        }

        if (!doc.contains("functionTable") || !doc["functionTable"].is_object()) {
            throw schema_error("functionTable must be an object");
        }

        for (const auto& [name, fn] : doc["functionTable"].items()) {
            if (!fn.is_object() || !fn.contains("args") || !fn["args"].is_object()) {
                throw schema_error("function '" + name + "' must declare an args object");
            }
            if (!fn.contains("ret") || !(fn["ret"].is_string() || fn["ret"].is_object())) {
                throw schema_error("function '" + name + "' must declare a return type");
            }

            call_descriptor call;
            call.name = name;
            call.arg_type = fn["args"];
            call.ret_type = fn["ret"];
            call.declared_errors = declared_throws(annotations, name);
            result->calls_.emplace(name, std::move(call));
        }

        result->doc_ = std::move(doc);

        SDKGATE_LOG_DEBUG("Loaded AST with {} functions and {} types",
                          result->calls_.size(), result->doc_["typeTable"].size());
        return result;
    }

    static std::shared_ptr<ast_schema> from_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) {
            throw schema_error("cannot open AST file: " + path.string());
        }
        try {
            return from_json(json::parse(in));
        } catch (const json::parse_error& e) {
            throw schema_error("invalid AST file " + path.string() + ": " + e.what());
        }
    }

    const call_descriptor* lookup_call(std::string_view name) const override {
        auto it = calls_.find(name);
        return it == calls_.end() ? nullptr : &it->second;
    }

    const json& type_table() const override {
        return doc_["typeTable"];
    }

    const json& description() const override {
        return doc_;
    }

    /// Error type names the document declares
    const std::vector<std::string>& errors() const noexcept {
        return errors_;
    }

private:
    ast_schema() = default;

    static void check_type_definition(const std::string& name, const json& def) {
        if (def.is_string() || def.is_object()) {
            return;
        }
        if (def.is_array() && !def.empty() &&
            std::all_of(def.begin(), def.end(), [](const json& v) { return v.is_string(); })) {
            return;
        }
        throw schema_error("type '" + name + "' must be a struct, enum or alias");
    }

    static std::vector<std::string> declared_throws(const json& annotations, const std::string& fn) {
        std::vector<std::string> result;
        auto it = annotations.find("fn." + fn);
        if (it == annotations.end()) {
            return result;
        }
        if (!it->is_array()) {
            throw schema_error("annotations for '" + fn + "' must be an array");
        }
        for (const auto& ann : *it) {
            if (!ann.is_object() || ann.value("type", "") != "throws") {
                continue;
            }
            if (!ann.contains("value") || !ann["value"].is_string()) {
                throw schema_error("throws annotation on '" + fn + "' must name an error");
            }
            result.push_back(ann["value"].get<std::string>());
        }
        return result;
    }

    json doc_;
    std::map<std::string, call_descriptor, std::less<>> calls_;
    std::vector<std::string> errors_;
};

} // namespace sdkgate::schema
