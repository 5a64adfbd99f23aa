/**
 * Font asset probing with FreeType
 */

#include "jade/text/font_probe.hpp"
#include "jade/core/logger.hpp"
#include <filesystem>
#include <format>
#include <mutex>
#include <system_error>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace jade::text {

namespace {

Logger& log() {
    static Logger& logger = logging::get("jade.fonts");
    return logger;
}

// Closes the face on every exit path
class FaceHandle {
public:
    FaceHandle() = default;
    ~FaceHandle() {
        if (m_face) {
            FT_Done_Face(m_face);
        }
    }

    FaceHandle(const FaceHandle&) = delete;
    FaceHandle& operator=(const FaceHandle&) = delete;

    FT_Face* out() { return &m_face; }
    FT_Face get() const { return m_face; }

private:
    FT_Face m_face{nullptr};
};

} // anonymous namespace

const std::string& asset_family(const FontAsset& asset) {
    return std::visit([](const auto& a) -> const std::string& { return a.family; }, asset);
}

unicode::CodePoint sample_code_point(Script script) noexcept {
    switch (script) {
        case Script::Thai: return 0x0E01;         // KO KAI
        case Script::Latin: return 'A';
        case Script::Han: return 0x4E00;
        case Script::Kana: return 0x3042;         // HIRAGANA A
        case Script::Hangul: return 0xAC00;
        case Script::Emoji: return 0x1F600;
        case Script::Digit: return '0';
        case Script::Punctuation: return '.';
        case Script::Control: return ' ';
        case Script::Other: return 0x2211;        // N-ARY SUMMATION
    }
    return 'A';
}

// ============================================================================
// FreeTypeFontProbe
// ============================================================================

struct FreeTypeFontProbe::LibraryData {
    FT_Library library{nullptr};
    FT_Error init_error{0};
    // FT_Library is not safe for concurrent face creation
    std::mutex mutex;
};

FreeTypeFontProbe::FreeTypeFontProbe(FontProbeOptions options)
    : m_options(options), m_data(std::make_unique<LibraryData>()) {
    m_data->init_error = FT_Init_FreeType(&m_data->library);
    if (m_data->init_error) {
        log().error_fmt("FreeType initialization failed (error {})", m_data->init_error);
        m_data->library = nullptr;
    }
}

FreeTypeFontProbe::~FreeTypeFontProbe() {
    if (m_data->library) {
        FT_Done_FreeType(m_data->library);
    }
}

Result<void, std::string> FreeTypeFontProbe::probe(const FontAssetSpec& spec) const {
    if (!m_data->library) {
        return make_error(std::format("FreeType unavailable (error {})", m_data->init_error));
    }

    auto regular = probe_face(spec.path, spec.script);
    if (!regular) {
        return regular;
    }
    if (!spec.bold_path.empty()) {
        return probe_face(spec.bold_path, spec.script);
    }
    return {};
}

Result<void, std::string> FreeTypeFontProbe::probe_face(const std::string& path, Script script) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(std::format("cannot stat {}: {}", path, ec.message()));
    }
    if (size < m_options.min_file_size) {
        return make_error(std::format("{} is {} bytes, below the {} byte minimum",
                                      path, size, m_options.min_file_size));
    }

    std::lock_guard<std::mutex> lock(m_data->mutex);

    FaceHandle face;
    FT_Error error = FT_New_Face(m_data->library, path.c_str(), 0, face.out());
    if (error) {
        return make_error(std::format("FreeType cannot open {} (error {})", path, error));
    }

    auto cp = sample_code_point(script);
    if (FT_Get_Char_Index(face.get(), static_cast<FT_ULong>(cp)) == 0) {
        return make_error(std::format("{} has no glyph for U+{:04X}", path,
                                      static_cast<u32>(cp)));
    }

    return {};
}

// ============================================================================
// Seed construction
// ============================================================================

std::vector<FontSeedEntry> probe_font_assets(
    const std::vector<FontAssetSpec>& specs, const FontProbe& probe) {

    std::vector<FontSeedEntry> seed;
    seed.reserve(specs.size());

    for (const auto& spec : specs) {
        auto result = probe.probe(spec);
        if (result) {
            log().debug_fmt("font {} ready for {}", spec.family, script_name(spec.script));
            seed.push_back({spec.script, AvailableFont{spec.family}});
        } else {
            seed.push_back({spec.script, MissingFont{spec.family, result.error()}});
        }
    }
    return seed;
}

std::vector<FontAssetSpec> default_asset_specs(std::string_view font_dir) {
    auto path = [font_dir](std::string_view file) {
        return (std::filesystem::path(font_dir) / file).string();
    };

    return {
        {Script::Thai, "NotoSansThai", path("NotoSansThai-Regular.ttf"), path("NotoSansThai-Bold.ttf")},
        {Script::Latin, "NotoSans", path("NotoSans-Regular.ttf"), path("NotoSans-Bold.ttf")},
        {Script::Han, "NotoSansSC", path("NotoSansSC-Regular.otf"), path("NotoSansSC-Bold.otf")},
        {Script::Kana, "NotoSansJP", path("NotoSansJP-Regular.otf"), path("NotoSansJP-Bold.otf")},
        {Script::Hangul, "NotoSansKR", path("NotoSansKR-Regular.otf"), path("NotoSansKR-Bold.otf")},
        {Script::Emoji, "NotoEmoji", path("NotoEmoji-Regular.ttf"), path("NotoEmoji-Bold.ttf")},
        {Script::Other, "NotoSansSymbols", path("NotoSansSymbols-Regular.ttf"),
         path("NotoSansSymbols-Bold.ttf")},
    };
}

std::vector<std::string> default_font_dirs() {
    return {
        "fonts",
        "/usr/share/fonts/truetype/noto",
        "/usr/share/fonts/opentype/noto",
        "/usr/local/share/fonts/noto",
    };
}

std::vector<FontSeedEntry> resolve_font_assets(
    const std::vector<std::string>& font_dirs, const FontProbe& probe) {

    std::vector<std::vector<FontAssetSpec>> per_dir;
    per_dir.reserve(font_dirs.size());
    for (const auto& dir : font_dirs) {
        per_dir.push_back(default_asset_specs(dir));
    }

    auto families = default_asset_specs("");
    std::vector<FontSeedEntry> seed;
    seed.reserve(families.size());

    for (usize i = 0; i < families.size(); ++i) {
        const auto& family = families[i];
        std::string reasons;
        bool found = false;

        for (const auto& specs : per_dir) {
            const auto& spec = specs[i];
            auto result = probe.probe(spec);
            if (result) {
                log().debug_fmt("font {} ready for {} at {}", spec.family,
                                script_name(spec.script), spec.path);
                seed.push_back({spec.script, AvailableFont{spec.family}});
                found = true;
                break;
            }
            if (!reasons.empty()) reasons += "; ";
            reasons += result.error();
        }

        if (!found) {
            if (reasons.empty()) reasons = "no font directory searched";
            seed.push_back({family.script, MissingFont{family.family, std::move(reasons)}});
        }
    }
    return seed;
}

} // namespace jade::text
