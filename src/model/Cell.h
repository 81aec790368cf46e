#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace model {

enum class EmbKind : uint8_t
{
    Normal = 0,
    Hammer,     // h
    Pull,       // p
    Bend,       // b
    Release,    // r
    SlideUp,    // /
    SlideDown,  // backslash
    Vibrato,    // ~
    Ghost,      // (
    Muffled     // X
};

char embGlyph(EmbKind kind);
bool embFromGlyph(char glyph, EmbKind& kind);

struct Cell
{
    enum class Kind : uint8_t
    {
        Blank,
        Note,
        Barline,
        Other   // Unrecognised text, kept verbatim
    };

    static constexpr int WIDTH = 3;
    static constexpr int MAX_FRET = 24;
    static constexpr int MAX_ENTRY_FRET = 12;

    Kind kind = Kind::Blank;
    EmbKind emb = EmbKind::Normal;
    int fret = 0;
    std::string raw;    // Only used for Kind::Other

    static Cell blank() { return Cell(); }
    static Cell barline() { Cell c; c.kind = Kind::Barline; return c; }
    static Cell note(int fret, EmbKind emb = EmbKind::Normal);

    static Cell parse(std::string_view text);

    bool isNote() const { return kind == Kind::Note; }
    bool isBlank() const { return kind == Kind::Blank; }
    bool isBarline() const { return kind == Kind::Barline; }

    std::string toString() const;
};

} // namespace model
