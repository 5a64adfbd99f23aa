#pragma once

#include "script.hpp"
#include "jade/core/types.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jade::text {

// ============================================================================
// Font assets
// ============================================================================

struct FontAssetSpec {
    Script script{Script::Other};
    std::string family;
    std::string path;
    std::string bold_path;      // empty when the family ships no bold face
};

// A font that passed probing
struct AvailableFont {
    std::string family;

    bool operator==(const AvailableFont&) const = default;
};

// A font that was expected but could not be used
struct MissingFont {
    std::string family;
    std::string reason;

    bool operator==(const MissingFont&) const = default;
};

using FontAsset = std::variant<AvailableFont, MissingFont>;

[[nodiscard]] const std::string& asset_family(const FontAsset& asset);

[[nodiscard]] inline bool is_available(const FontAsset& asset) {
    return std::holds_alternative<AvailableFont>(asset);
}

// One entry of the registry seed
struct FontSeedEntry {
    Script script{Script::Other};
    FontAsset asset;
};

// ============================================================================
// Probing
// ============================================================================

// Code point a font must cover to serve a script
[[nodiscard]] unicode::CodePoint sample_code_point(Script script) noexcept;

struct FontProbeOptions {
    // Smaller files are treated as truncated or placeholder downloads
    usize min_file_size{40000};
};

class FontProbe {
public:
    virtual ~FontProbe() = default;

    // Ok when `spec.path`, and `spec.bold_path` if set, are usable faces
    // for `spec.script`
    [[nodiscard]] virtual Result<void, std::string> probe(const FontAssetSpec& spec) const = 0;
};

// Opens each face with FreeType and checks the script's sample glyph
class FreeTypeFontProbe : public FontProbe {
public:
    explicit FreeTypeFontProbe(FontProbeOptions options = {});
    ~FreeTypeFontProbe() override;

    FreeTypeFontProbe(const FreeTypeFontProbe&) = delete;
    FreeTypeFontProbe& operator=(const FreeTypeFontProbe&) = delete;

    [[nodiscard]] Result<void, std::string> probe(const FontAssetSpec& spec) const override;

    [[nodiscard]] const FontProbeOptions& options() const { return m_options; }

private:
    struct LibraryData;

    [[nodiscard]] Result<void, std::string> probe_face(const std::string& path, Script script) const;

    FontProbeOptions m_options;
    std::unique_ptr<LibraryData> m_data;
};

// Probes every asset, in order, into Available or Missing seed entries
[[nodiscard]] std::vector<FontSeedEntry> probe_font_assets(
    const std::vector<FontAssetSpec>& specs, const FontProbe& probe);

// Noto families for each script, Regular and Bold, expected under `font_dir`
[[nodiscard]] std::vector<FontAssetSpec> default_asset_specs(std::string_view font_dir);

// Searched in order: the working directory's fonts/, then system Noto paths
[[nodiscard]] std::vector<std::string> default_font_dirs();

/**
 * Resolves each default family against `font_dirs` in order.
 *
 * A family is Available from the first directory whose faces pass the
 * probe. Otherwise it is Missing with every directory's failure joined
 * into the reason.
 */
[[nodiscard]] std::vector<FontSeedEntry> resolve_font_assets(
    const std::vector<std::string>& font_dirs, const FontProbe& probe);

} // namespace jade::text
