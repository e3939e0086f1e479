#include "object.store.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace {
std::string
to_lower(std::string_view str)
{
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    return lower;
}
} // namespace

bool
upload::parse_object_metadata(std::string_view json,
                              ObjectMetadata& metadata,
                              std::string& error)
{
    metadata = {};
    if (json.empty()) {
        return true;
    }

    auto val = nlohmann::json::parse(json,
                                     nullptr, // callback
                                     false,   // allow exceptions
                                     true     // ignore comments
    );

    if (val.is_discarded()) {
        error = "Invalid JSON: '" + std::string(json) + "'";
        return false;
    }

    if (!val.is_object()) {
        error = "Object metadata must be a JSON object, got " +
                std::string(val.type_name());
        return false;
    }

    for (const auto& [key, value] : val.items()) {
        if (key.empty()) {
            error = "Object metadata has an empty key";
            return false;
        }

        if (!value.is_string()) {
            error = "Value of metadata key '" + key + "' must be a string";
            return false;
        }

        if (to_lower(key) == "content-type") {
            metadata.content_type = value.get<std::string>();
        } else {
            metadata.user_metadata[key] = value.get<std::string>();
        }
    }

    return true;
}
