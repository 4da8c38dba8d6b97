#include "display.h"
#include "core/constants.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace optidex {

namespace {

/// Copy a field into the delta when it differs from the stored value
void merge_field(const std::optional<std::string>& incoming,
                 std::string& stored,
                 std::optional<std::string>& delta) {
    if (!incoming) return;
    if (*incoming != stored) {
        stored = *incoming;
        delta = stored;
    }
}

} // namespace

DisplayState::DisplayState()
    : status_("starting")
    , emoji_("😊")
    , color_(constants::display::IDLE_COLOR) {}

DisplayUpdate DisplayState::merge(const DisplayUpdate& update) {
    DisplayUpdate delta;
    merge_field(update.status, status_, delta.status);
    merge_field(update.emoji, emoji_, delta.emoji);
    merge_field(update.text, text_, delta.text);
    merge_field(update.color, color_, delta.color);
    merge_field(update.image, image_, delta.image);

    // Live frames keep the same path; the UI must reload the file anyway
    if (update.force_image && update.image && !update.image->empty()) {
        delta.image = *update.image;
    }
    return delta;
}

DisplayUpdate DisplayState::full() const {
    DisplayUpdate all;
    all.status = status_;
    all.emoji = emoji_;
    all.text = text_;
    all.color = color_;
    all.image = image_;
    return all;
}

std::string display_update_to_json(const DisplayUpdate& update) {
    json j = json::object();
    if (update.status) j["status"] = *update.status;
    if (update.emoji) j["emoji"] = *update.emoji;
    if (update.text) j["text"] = *update.text;
    if (update.color) j["RGB"] = *update.color;
    if (update.image) j["image"] = *update.image;
    j["brightness"] = 100;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace optidex
