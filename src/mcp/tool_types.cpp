#include <mcp_bridge/mcp/tool_types.hpp>
#include <mcp_bridge/core/log.hpp>

namespace mcp_bridge {

namespace {

Error MakeListingError(const std::string& operation,
                       const std::string& provider_name,
                       const std::string& message) {
    return Error{operation, provider_name, message, ErrorCategory::Protocol};
}

} // anonymous namespace

Result<std::vector<ToolInfo>, Error> ParseToolCatalog(
    const std::string& provider_name,
    const nlohmann::json& listing) {
    using R = Result<std::vector<ToolInfo>, Error>;

    const nlohmann::json* tools = &listing;
    if (listing.is_object()) {
        if (!listing.contains("tools")) {
            return R::Err(MakeListingError("ListTools", provider_name,
                                           "Tool listing has no 'tools' field"));
        }
        tools = &listing["tools"];
    }
    if (!tools->is_array()) {
        return R::Err(MakeListingError("ListTools", provider_name,
                                       "Tool listing is not an array"));
    }

    std::vector<ToolInfo> result;
    for (const auto& entry : *tools) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            LogWarn("registry", "Skipping unnamed tool from '" + provider_name + "'");
            continue;
        }
        ToolInfo info;
        info.provider_name = provider_name;
        info.tool_name = entry["name"].get<std::string>();
        if (entry.contains("description") && entry["description"].is_string()) {
            info.description = entry["description"].get<std::string>();
        }
        if (entry.contains("inputSchema")) {
            info.input_schema = entry["inputSchema"];
        } else if (entry.contains("input_schema")) {
            info.input_schema = entry["input_schema"];
        }
        result.push_back(std::move(info));
    }
    return R::Ok(std::move(result));
}

Result<nlohmann::json, Error> ParseResourceList(
    const std::string& provider_name,
    const nlohmann::json& listing) {
    using R = Result<nlohmann::json, Error>;
    if (listing.is_array()) {
        return R::Ok(listing);
    }
    if (listing.is_object() && listing.contains("resources") &&
        listing["resources"].is_array()) {
        return R::Ok(listing["resources"]);
    }
    return R::Err(MakeListingError("ListResources", provider_name,
                                   "Resource listing is not an array"));
}

} // namespace mcp_bridge
