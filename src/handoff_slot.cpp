#include "handoff_slot.h"
#include "logger.h"

namespace optidex {

void HandoffSlot::set(VisualModeRequest request, TurnId turn) {
    VisualKind incoming = kind_of(request);
    auto displaced = box_.set(std::move(request), turn);
    if (displaced) {
        Logger::warn(std::string("Handoff slot overwritten: pending ") + visual_kind_name(kind_of(*displaced)) +
                     " request replaced by " + visual_kind_name(incoming));
    } else {
        LOG_FSM(std::string("Visual mode queued for after speech: ") + visual_kind_name(incoming) +
                " (turn " + std::to_string(turn) + ")");
    }
}

std::optional<VisualModeRequest> HandoffSlot::take_and_clear() {
    return box_.take_and_clear();
}

std::optional<VisualModeRequest> HandoffSlot::take_for_turn(TurnId turn) {
    return box_.take_for_turn(turn, "visual mode request");
}

bool HandoffSlot::has_pending() const {
    return box_.has_value();
}

bool HandoffSlot::has_pending_for(TurnId turn) const {
    return box_.has_value_for(turn);
}

std::optional<VisualKind> HandoffSlot::pending_kind() const {
    auto pending = box_.peek();
    if (!pending) return std::nullopt;
    return kind_of(*pending);
}

} // namespace optidex
