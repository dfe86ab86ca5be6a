#include "ChatContext.hpp"

#include <stdexcept>

namespace voicenote {

std::string ChatContext::TypeName() const {
    return type == Type::PreMatch ? "preMatch" : "relationship";
}

ChatContext ChatContext::Parse(const std::string& typeName, const std::string& id) {
    if (typeName == "preMatch") {
        return PreMatch(id);
    }
    if (typeName == "relationship") {
        return Relationship(id);
    }
    throw std::invalid_argument("Unknown chat context type: " + typeName);
}

void to_json(nlohmann::json& json, const ChatContext& context) {
    json = nlohmann::json{{"type", context.TypeName()}};
    if (context.type == ChatContext::Type::PreMatch) {
        json["applicationId"] = context.id;
    } else {
        json["relationshipId"] = context.id;
    }
}

} // namespace voicenote
