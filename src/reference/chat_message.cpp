#include <spdlog/spdlog.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <ytplay/reference.hpp>

#include "utils.hpp"

namespace ytplay {

namespace {

EntityKind entity_kind(const std::string &type) {
	if (type == "url") return EntityKind::url;
	if (type == "text_link") return EntityKind::text_link;
	return EntityKind::other;
}

ChatMessage message_from_json(const nlohmann::json &j) {
	ChatMessage msg;
	if (auto text = utils::traverse_obj<std::string>(j, {"text"})) {
		msg.text = *text;
	}
	if (auto caption = utils::traverse_obj<std::string>(j, {"caption"})) {
		msg.caption = *caption;
	}

	if (const auto *entities = utils::traverse_json(j, {"entities"});
		entities && entities->is_array()) {
		for (const auto &e : *entities) {
			MessageEntity entity;
			entity.kind = entity_kind(
				utils::traverse_obj_default<std::string>(e, {"type"}, ""));
			auto offset = utils::traverse_obj_default<long long>(e, {"offset"}, 0);
			auto length = utils::traverse_obj_default<long long>(e, {"length"}, 0);
			entity.offset = offset > 0 ? static_cast<std::size_t>(offset) : 0;
			entity.length = length > 0 ? static_cast<std::size_t>(length) : 0;
			entity.url = utils::traverse_obj_default<std::string>(e, {"url"}, "");
			msg.entities.push_back(std::move(entity));
		}
	}

	if (const auto *reply = utils::traverse_json(j, {"reply_to"});
		reply && reply->is_object()) {
		msg.reply_to = std::make_shared<const ChatMessage>(message_from_json(*reply));
	}
	return msg;
}

}  // namespace

Result<ChatMessage> parse_chat_message(std::string_view json) {
	auto j = nlohmann::json::parse(json, nullptr, false);
	if (j.is_discarded()) return make_error_code(errc::json_parse_error);
	if (!j.is_object()) {
		spdlog::debug("Chat message is not a JSON object");
		return make_error_code(errc::json_parse_error);
	}
	return message_from_json(j);
}

}  // namespace ytplay
