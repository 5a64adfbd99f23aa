#pragma once

#include "font_probe.hpp"
#include "script.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace jade::text {

constexpr std::string_view DEFAULT_FALLBACK_FAMILY = "NotoSans";

// ============================================================================
// Font Registry
// ============================================================================

/**
 * Ordered font candidates per script, built once from probed assets.
 *
 * Every script's candidate list ends with the universal fallback, so
 * candidates() is never empty. Missing assets stay visible through
 * chain() but are never offered as candidates. The fallback counts as
 * available only when the seed carries it as an AvailableFont. The registry is immutable
 * after construction and safe to share between threads.
 */
class FontRegistry {
public:
    FontRegistry(std::vector<FontSeedEntry> seed, std::string fallback_family);

    // Available families for the script in seed order, then the fallback
    [[nodiscard]] const std::vector<std::string>& candidates(Script script) const;

    // Same order as candidates(), including missing assets
    [[nodiscard]] const std::vector<FontAsset>& chain(Script script) const;

    [[nodiscard]] const std::string& fallback_family() const { return m_fallback; }

    // False unless the seed holds the fallback as an AvailableFont
    [[nodiscard]] bool fallback_available() const { return is_available(m_fallback_asset); }

    // Last entry of every chain
    [[nodiscard]] const FontAsset& fallback_asset() const { return m_fallback_asset; }

    [[nodiscard]] bool contains(std::string_view family) const;

    // Probes the Noto families, taking each from the first directory that has it
    [[nodiscard]] static std::vector<FontSeedEntry> build_default_seed(
        const FontProbe& probe, const std::vector<std::string>& font_dirs = default_font_dirs());

    // Process-wide instance. The first call constructs it; later calls
    // ignore their arguments and return the same registry.
    static const FontRegistry& install_shared(std::vector<FontSeedEntry> seed,
                                              std::string fallback_family);

    // The installed instance, or nullptr before install_shared
    [[nodiscard]] static const FontRegistry* shared();

private:
    std::string m_fallback;
    FontAsset m_fallback_asset;
    std::array<std::vector<std::string>, SCRIPT_COUNT> m_candidates;
    std::array<std::vector<FontAsset>, SCRIPT_COUNT> m_chains;
};

} // namespace jade::text
