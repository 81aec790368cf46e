#include "Cell.h"
#include <algorithm>
#include <cstdio>

namespace model {

namespace {

const char glyphs[] = {'-', 'h', 'p', 'b', 'r', '/', '\\', '~', '(', 'X'};

bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // anonymous namespace

char embGlyph(EmbKind kind)
{
    return glyphs[static_cast<int>(kind)];
}

bool embFromGlyph(char glyph, EmbKind& kind)
{
    for (int i = 0; i < static_cast<int>(sizeof(glyphs)); ++i)
    {
        if (glyphs[i] == glyph)
        {
            kind = static_cast<EmbKind>(i);
            return true;
        }
    }
    return false;
}

Cell Cell::note(int fret, EmbKind emb)
{
    Cell c;
    c.kind = Kind::Note;
    c.emb = emb;
    c.fret = std::clamp(fret, 0, MAX_FRET);
    return c;
}

Cell Cell::parse(std::string_view text)
{
    Cell c;
    if (text.size() != WIDTH)
    {
        c.kind = Kind::Other;
        c.raw = std::string(text);
        return c;
    }

    if (text == "---") return blank();
    if (text == "--|") return barline();

    EmbKind emb;
    if (embFromGlyph(text[0], emb) && isDigit(text[2]))
    {
        if (text[1] == '-')
            return note(text[2] - '0', emb);
        if (isDigit(text[1]))
        {
            int fret = (text[1] - '0') * 10 + (text[2] - '0');
            if (fret <= MAX_FRET)
                return note(fret, emb);
        }
    }

    c.kind = Kind::Other;
    c.raw = std::string(text);
    return c;
}

std::string Cell::toString() const
{
    switch (kind)
    {
        case Kind::Blank: return "---";
        case Kind::Barline: return "--|";
        case Kind::Other: return raw;
        case Kind::Note:
        {
            char buf[8];
            if (fret < 10)
                snprintf(buf, sizeof(buf), "%c-%d", embGlyph(emb), fret);
            else
                snprintf(buf, sizeof(buf), "%c%02d", embGlyph(emb), fret);
            return buf;
        }
    }
    return "---";
}

} // namespace model
