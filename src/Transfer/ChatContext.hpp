#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace voicenote {

// Which conversation a voice message belongs to. Either a pre-match chat
// (keyed by application id) or an established relationship.
struct ChatContext {
    enum class Type {
        PreMatch,
        Relationship
    };

    Type type = Type::PreMatch;
    std::string id;

    static ChatContext PreMatch(std::string applicationId) {
        return ChatContext{Type::PreMatch, std::move(applicationId)};
    }
    static ChatContext Relationship(std::string relationshipId) {
        return ChatContext{Type::Relationship, std::move(relationshipId)};
    }

    // "preMatch" or "relationship"
    std::string TypeName() const;

    // Throws std::invalid_argument for an unknown type name
    static ChatContext Parse(const std::string& typeName, const std::string& id);
};

void to_json(nlohmann::json& json, const ChatContext& context);

} // namespace voicenote
