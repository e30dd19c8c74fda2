// ==============================================================================
// bridge.cpp - Контекст агента и применение его ответа
// ==============================================================================

#include "duet/bridge.hpp"

#include <sstream>

namespace duet {

std::string DocumentBridge::get_context() const {
    const Schema& schema = document_.schema();
    auto data = document_.snapshot();

    std::ostringstream out;
    out << schema.describe() << "\n";

    out << "Current values:\n";
    for (const auto& field : schema.fields()) {
        out << "- " << field.id << ": ";
        auto it = data->find(field.id);
        if (it == data->end()) {
            out << "(not set)";
        } else {
            out << it->second.to_display_string();
        }
        out << "\n";
    }

    auto missing = document_.missing_required();
    if (!missing.empty()) {
        out << "\nMissing required:";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            out << (i == 0 ? " " : ", ") << missing[i];
        }
        out << "\n";
    }

    out << "\nTo change values, respond with a JSON Patch array:\n"
        << "[{\"op\": \"replace\", \"path\": \"/<field id>\", \"value\": <new value>}]\n"
        << "Keys inside object fields are addressed as \"/<field id>/<key>\".\n"
        << "Only \"replace\" and \"add\" are supported. Dates are epoch seconds.\n"
        << "All operations are applied together or not at all.\n";
    return out.str();
}

std::size_t DocumentBridge::apply_actions(std::string_view response) {
    last_result_ = document_.apply_from_text(response, source_);
    return last_result_.operations_applied;
}

}  // namespace duet
