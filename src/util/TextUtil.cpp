#include "util/TextUtil.hpp"
#include <cctype>
#include <cstdint>
#include <unordered_set>

namespace textutil {

// index alphabet: ascii letters and digits, plus '+' and '#' for names like c++ / c#
static bool is_term_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '+' || c == '#';
}

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    // a separator is only emitted once the next term character shows up
    bool gap = false;
    for (unsigned char ch : s) {
        if (ch >= 0x80 || !is_term_char(ch)) {
            gap = !out.empty();
            continue;
        }
        if (gap) {
            out.push_back(' ');
            gap = false;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;

    size_t pos = 0;
    while (pos < normalized.size()) {
        size_t end = normalized.find(' ', pos);
        if (end == std::string::npos) end = normalized.size();

        // drop one-character tokens; "c++" and "c#" stay
        if (end - pos >= 2) tokens.emplace_back(normalized, pos, end - pos);
        pos = end + 1;
    }
    return tokens;
}

std::vector<std::string> terms_of(const std::string& raw) {
    return tokenize(normalize(raw));
}

// ---------- concept folding ----------

static constexpr uint32_t kReplacement = 0xFFFD;

static std::vector<uint32_t> decode_utf8(const std::string& s) {
    std::vector<uint32_t> cps;
    cps.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        uint32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
        else {
            cps.push_back(kReplacement);
            ++i;
            continue;
        }

        if (i + len > s.size()) {
            cps.push_back(kReplacement);
            break;
        }

        bool ok = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!ok) {
            cps.push_back(kReplacement);
            ++i;
            continue;
        }

        cps.push_back(cp);
        i += len;
    }
    return cps;
}

static void encode_utf8(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

static bool is_space_cp(uint32_t cp) {
    if (cp < 0x80) return std::isspace(static_cast<unsigned char>(cp)) != 0;
    return cp == 0x00A0 || cp == 0x3000 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x202F;
}

static uint32_t lower_cp(uint32_t cp) {
    // full-width ASCII variants
    if (cp >= 0xFF01 && cp <= 0xFF5E) cp = cp - 0xFF01 + 0x21;

    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;

    // Latin-1 supplement (U+00D7 is the multiplication sign)
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;

    // Latin Extended-A
    if (cp == 0x130) return 'i';
    if (cp == 0x178) return 0xFF;
    if (cp == 0x17F) return 's';
    if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    return cp;
}

// base + combining mark -> precomposed Latin-1 lowercase letter, 0 if none
static uint32_t compose(uint32_t base, uint32_t mark) {
    switch (mark) {
        case 0x300: // grave
            switch (base) {
                case 'a': return 0xE0; case 'e': return 0xE8; case 'i': return 0xEC;
                case 'o': return 0xF2; case 'u': return 0xF9;
            }
            break;
        case 0x301: // acute
            switch (base) {
                case 'a': return 0xE1; case 'e': return 0xE9; case 'i': return 0xED;
                case 'o': return 0xF3; case 'u': return 0xFA; case 'y': return 0xFD;
            }
            break;
        case 0x302: // circumflex
            switch (base) {
                case 'a': return 0xE2; case 'e': return 0xEA; case 'i': return 0xEE;
                case 'o': return 0xF4; case 'u': return 0xFB;
            }
            break;
        case 0x303: // tilde
            switch (base) {
                case 'a': return 0xE3; case 'n': return 0xF1; case 'o': return 0xF5;
            }
            break;
        case 0x308: // diaeresis
            switch (base) {
                case 'a': return 0xE4; case 'e': return 0xEB; case 'i': return 0xEF;
                case 'o': return 0xF6; case 'u': return 0xFC; case 'y': return 0xFF;
            }
            break;
        case 0x30A: // ring
            if (base == 'a') return 0xE5;
            break;
        case 0x327: // cedilla
            if (base == 'c') return 0xE7;
            break;
    }
    return 0;
}

std::string fold_concept(const std::string& s) {
    const auto cps = decode_utf8(s);

    std::vector<uint32_t> folded;
    folded.reserve(cps.size());

    bool pending_space = false;
    for (uint32_t raw : cps) {
        uint32_t cp = lower_cp(raw);

        if (is_space_cp(cp)) {
            pending_space = !folded.empty();
            continue;
        }

        if (pending_space) {
            folded.push_back(' ');
            pending_space = false;
        }

        if (!folded.empty()) {
            uint32_t composed = compose(folded.back(), cp);
            if (composed != 0) {
                folded.back() = composed;
                continue;
            }
        }
        folded.push_back(cp);
    }

    std::string out;
    out.reserve(s.size());
    for (uint32_t cp : folded) encode_utf8(cp, out);
    return out;
}

std::vector<std::string> fold_concepts(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    std::unordered_set<std::string> seen;
    seen.reserve(names.size());

    for (const auto& n : names) {
        std::string f = fold_concept(n);
        if (f.empty()) continue;
        if (seen.insert(f).second) out.push_back(std::move(f));
    }
    return out;
}

std::string snippet(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;

    size_t cut = max_chars;
    // don't split a multi-byte sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "...";
}

}
