#include "jade/text/font_registry.hpp"
#include "jade/core/logger.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>

namespace jade::text {

namespace {

Logger& log() {
    static Logger& logger = logging::get("jade.fonts");
    return logger;
}

std::once_flag g_shared_once;
std::unique_ptr<FontRegistry> g_shared_storage;
std::atomic<const FontRegistry*> g_shared{nullptr};

} // anonymous namespace

FontRegistry::FontRegistry(std::vector<FontSeedEntry> seed, std::string fallback_family)
    : m_fallback(std::move(fallback_family)) {

    bool fallback_probed = false;
    std::string fallback_reason = "not probed";
    for (const auto& entry : seed) {
        if (asset_family(entry.asset) != m_fallback) continue;
        if (is_available(entry.asset)) {
            fallback_probed = true;
        } else {
            fallback_reason = std::get<MissingFont>(entry.asset).reason;
        }
    }

    m_fallback_asset = fallback_probed
        ? FontAsset{AvailableFont{m_fallback}}
        : FontAsset{MissingFont{m_fallback, fallback_reason}};

    for (auto& entry : seed) {
        const auto& family = asset_family(entry.asset);
        if (family == m_fallback) {
            continue;   // appended last for every script
        }

        auto index = script_index(entry.script);
        auto& chain = m_chains[index];
        if (std::find(chain.begin(), chain.end(), entry.asset) != chain.end()) {
            continue;
        }

        if (auto* missing = std::get_if<MissingFont>(&entry.asset)) {
            log().warn_fmt("font {} for {} is missing: {}", missing->family,
                           script_name(entry.script), missing->reason);
        } else {
            m_candidates[index].push_back(family);
        }
        chain.push_back(std::move(entry.asset));
    }

    for (auto script : ALL_SCRIPTS) {
        auto index = script_index(script);
        m_candidates[index].push_back(m_fallback);
        m_chains[index].push_back(m_fallback_asset);
    }

    if (!fallback_probed) {
        log().error_fmt("fallback font {} is missing ({}); scripts without a font will render as .notdef",
                        m_fallback, fallback_reason);
    }
}

const std::vector<std::string>& FontRegistry::candidates(Script script) const {
    return m_candidates[script_index(script)];
}

const std::vector<FontAsset>& FontRegistry::chain(Script script) const {
    return m_chains[script_index(script)];
}

bool FontRegistry::contains(std::string_view family) const {
    for (const auto& list : m_candidates) {
        if (std::find(list.begin(), list.end(), family) != list.end()) {
            return true;
        }
    }
    return false;
}

std::vector<FontSeedEntry> FontRegistry::build_default_seed(
    const FontProbe& probe, const std::vector<std::string>& font_dirs) {
    return resolve_font_assets(font_dirs, probe);
}

const FontRegistry& FontRegistry::install_shared(std::vector<FontSeedEntry> seed,
                                                 std::string fallback_family) {
    std::call_once(g_shared_once, [&] {
        g_shared_storage = std::make_unique<FontRegistry>(std::move(seed), std::move(fallback_family));
        g_shared.store(g_shared_storage.get(), std::memory_order_release);
        log().info_fmt("shared font registry installed, fallback {}",
                       g_shared_storage->fallback_family());
    });
    return *g_shared.load(std::memory_order_acquire);
}

const FontRegistry* FontRegistry::shared() {
    return g_shared.load(std::memory_order_acquire);
}

} // namespace jade::text
