// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cstdint>
#include <string>
#include <type_traits>

namespace orodb {

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parse a JSON string into a Document. On failure returns false and fills
    // @p err with the parser message and offset.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document, std::string* err = nullptr) {
        document.Parse(json_string.c_str(), json_string.size());
        if (document.HasParseError()) {
            if (err) {
                *err = std::string(rapidjson::GetParseError_En(document.GetParseError()))
                    + " at offset " + std::to_string(document.GetErrorOffset());
            }
            return false;
        }
        return true;
    }

    // Helper function to stringify a RapidJSON Document into a std::string.
    inline std::string stringify(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 4);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Template helper to get a value from a RapidJSON Value/Document.
    // Returns @p default_value when the key is missing or has another type.
    template <typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return std::string(val.GetString(), val.GetStringLength());
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        }
        return default_value;
    }

    // Template helper to set a value in a RapidJSON Document.
    template <typename T>
    inline void set(rapidjson::Document& document, const std::string& key, const T& value) {
        rapidjson::Document::AllocatorType& allocator = document.GetAllocator();
        if constexpr (std::is_same_v<T, std::string>) {
            document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                rapidjson::Value(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), allocator).Move(),
                allocator);
        } else {
            document.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                value,
                allocator);
        }
    }

    // Overload for setting values in a nested object.
    template <typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, rapidjson::Document::AllocatorType& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                rapidjson::Value(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), allocator).Move(),
                allocator);
        } else {
            parent.AddMember(rapidjson::Value(key.c_str(), allocator).Move(),
                value,
                allocator);
        }
    }

} // namespace jhlp

} // namespace orodb
