#include "world_state.hpp"
#include "util.hpp"

#include <algorithm>

namespace rumormill {

static constexpr size_t kThreadChars = 100;

WorldState WorldState::initial(const std::string& seed_event, const WorldConfig& cfg) {
    WorldState w;
    w.rumor_heat = std::clamp(cfg.heat_baseline, 0.0, 1.0);
    w.guard_alert_level = std::clamp(cfg.guard_baseline, 0.0, 1.0);
    w.shop_price_modifier = 1.0;
    w.last_event = seed_event;
    return w;
}

std::string WorldState::topic() const {
    return current_thread.empty() ? last_event : current_thread;
}

void WorldState::apply_rumor(const std::string& speaker, const std::string& content,
                             double delta, uint64_t turn, const WorldConfig& cfg) {
    // Heat follows the delta but leaks back toward baseline, so an
    // unreinforced rumor fades.
    double heat = rumor_heat + delta - cfg.heat_decay * (rumor_heat - cfg.heat_baseline);
    rumor_heat = std::clamp(heat, 0.0, 1.0);

    double alert = guard_alert_level;
    if (delta >= cfg.alert_threshold) {
        alert += delta * cfg.alert_gain;
    } else {
        alert -= cfg.heat_decay * (alert - cfg.guard_baseline);
    }
    guard_alert_level = std::clamp(alert, 0.0, 1.0);

    shop_price_modifier = std::clamp(shop_price_modifier + delta * cfg.price_gain, 0.5, 1.5);

    rumor_log.push_back({turn, speaker, content, delta});
    while (rumor_log.size() > cfg.rumor_log_limit) rumor_log.pop_front();

    current_thread = utf8_prefix(content, kThreadChars);
    conversation_beats.push_back(speaker + ": " + truncate(content, kThreadChars));
    while (conversation_beats.size() > cfg.beats_limit) conversation_beats.pop_front();
}

} // namespace rumormill
