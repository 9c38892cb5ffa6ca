#ifndef POLYVIEW_TERMINAL_HPP
#define POLYVIEW_TERMINAL_HPP

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Polyview::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";
        inline constexpr std::string_view kGoldenrod     = "\033[38;5;221m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";
    }

    // ---------- Small helpers ----------
    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Display width of a UTF-8 string (counts code points, not bytes).
    inline std::size_t DisplayWidth(std::string_view s) {
        std::size_t width = 0;
        for (const char c : s) {
            if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++width;
        }
        return width;
    }

    // ---------- Bars ----------
    // ┏━━━━…┓
    inline std::string TopBar(std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        return ApplyColor(std::string(kBoxTopLeft) + Repeat(kBoxHorizontal, inner_len) + std::string(kBoxTopRight), color);
    }

    inline std::string MiddleBar(std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        return ApplyColor(std::string(kBoxMiddleLeft) + Repeat(kBoxHorizontal, inner_len) + std::string(kBoxMiddleRight), color);
    }

    inline std::string BottomBar(std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        return ApplyColor(std::string(kBoxBottomLeft) + Repeat(kBoxHorizontal, inner_len) + std::string(kBoxBottomRight), color);
    }

    // ┃ text␣␣␣┃ padded to inner_len.
    inline std::string FramedLine(std::string_view text, std::size_t inner_len, std::string_view color) {
        using namespace Symbols;
        std::string line = ApplyColor(kBoxVertical, color);
        line.append(" ").append(text);
        const auto used = DisplayWidth(text) + 1;
        if (used < inner_len) line.append(inner_len - used, ' ');
        line.append(ApplyColor(kBoxVertical, color));
        return line;
    }

    // Prints a titled frame: ┏━━┓ / ┃ title ┃ / ┣━━┫ / rows / ┗━━┛
    inline void PrintFrame(std::ostream& stream,
                           std::string_view title,
                           const std::vector<std::pair<std::string, std::string>>& rows,
                           std::string_view color) {
        std::size_t key_width = 0;
        for (const auto& [key, value] : rows) {
            key_width = std::max(key_width, DisplayWidth(key));
        }

        std::vector<std::string> lines;
        lines.reserve(rows.size());
        std::size_t inner_len = DisplayWidth(title) + 2;
        for (const auto& [key, value] : rows) {
            std::string line = key;
            line.append(key_width - DisplayWidth(key), ' ');
            line.append(" : ").append(value);
            inner_len = std::max(inner_len, DisplayWidth(line) + 2);
            lines.push_back(std::move(line));
        }

        stream << TopBar(inner_len, color) << '\n';
        stream << FramedLine(ApplyColor(title, Colors::kGoldenrod), inner_len + Colors::kGoldenrod.size() + Colors::kReset.size(), color) << '\n';
        stream << MiddleBar(inner_len, color) << '\n';
        for (const auto& line : lines) {
            stream << FramedLine(line, inner_len, color) << '\n';
        }
        stream << BottomBar(inner_len, color) << '\n';
    }
}

#endif // POLYVIEW_TERMINAL_HPP
