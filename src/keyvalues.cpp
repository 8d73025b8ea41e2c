#include "keyvalues.hpp"
#include "console.h"
#include <algorithm>
#include <cctype>

namespace PakForge {
namespace KeyValues {

// ============================================================================
// Normalization
// ============================================================================

namespace {

struct Substitution {
    const char* bytes;
    size_t length;
    const char* replacement;   // empty = delete
};

// UTF-8 encodings of the characters authoring tools slip into KV text
const Substitution kSubstitutions[] = {
    {"\xE2\x80\x9C", 3, "\""},   // U+201C left double quote
    {"\xE2\x80\x9D", 3, "\""},   // U+201D right double quote
    {"\xE2\x80\x98", 3, "'"},    // U+2018 left single quote
    {"\xE2\x80\x99", 3, "'"},    // U+2019 right single quote
    {"\xC2\xA0", 2, " "},        // U+00A0 no-break space
    {"\xE2\x80\x87", 3, " "},    // U+2007 figure space
    {"\xE2\x80\xAF", 3, " "},    // U+202F narrow no-break space
    {"\xE2\x80\x8B", 3, ""},     // U+200B zero width space
    {"\xE2\x80\x8C", 3, ""},     // U+200C zero width non-joiner
    {"\xE2\x80\x8D", 3, ""},     // U+200D zero width joiner
    {"\xE2\x81\xA0", 3, ""},     // U+2060 word joiner
    {"\xEF\xBB\xBF", 3, ""},     // U+FEFF byte order mark, anywhere
};

std::string normalizePass(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        char c = text[i];
        if (c == '\r') {
            out += '\n';
            i += (i + 1 < n && text[i + 1] == '\n') ? 2 : 1;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc == 0xC2 || uc == 0xE2 || uc == 0xEF) {
            bool matched = false;
            for (const auto& sub : kSubstitutions) {
                if (i + sub.length <= n && text.compare(i, sub.length, sub.bytes, sub.length) == 0) {
                    out += sub.replacement;
                    i += sub.length;
                    matched = true;
                    break;
                }
            }
            if (matched) continue;
        }
        out += c;
        ++i;
    }
    return out;
}

} // namespace

std::string normalize(const std::string& text) {
    // Deleting a character can join the bytes around it into a new target
    // sequence, so repeat until nothing changes.
    std::string current = normalizePass(text);
    while (true) {
        std::string next = normalizePass(current);
        if (next == current) return current;
        current.swap(next);
    }
}

// ============================================================================
// Document model
// ============================================================================

bool BlockSpan::isNumeric() const {
    if (!quotedKey || key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string Document::tokenText(const Token& token) const {
    return text.substr(token.textBegin(), token.textLength());
}

std::string Document::blockText(const BlockSpan& block) const {
    return text.substr(block.begin, block.end - block.begin);
}

static bool tokenEqualsIgnoreCase(const std::string& text, const Token& token, const std::string& value) {
    if (token.textLength() != value.size()) return false;
    size_t start = token.textBegin();
    for (size_t i = 0; i < value.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[start + i])) !=
            std::tolower(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

bool Document::hasNestedKey(const BlockSpan& block, const std::string& key) const {
    for (size_t i = block.bodyFirstToken; i < block.bodyEndToken; ++i) {
        const Token& t = tokens[i];
        if (t.isKey && tokenEqualsIgnoreCase(text, t, key)) return true;
    }
    return false;
}

const BlockSpan* Document::findBlock(const std::string& id, const std::string& ownerTag) const {
    for (const auto& block : blocks) {
        if (block.key != id || !block.isNumeric()) continue;
        if (ownerTag.empty() || hasNestedKey(block, ownerTag)) return &block;
    }
    return nullptr;
}

const BlockSpan* Document::findSection(const std::string& name) const {
    for (const auto& block : blocks) {
        if (block.key.size() == name.size() &&
            std::equal(block.key.begin(), block.key.end(), name.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
            })) {
            return &block;
        }
    }
    return nullptr;
}

// ============================================================================
// Parser
// ============================================================================

namespace {

const int kMaxDepth = 256;

size_t lineNumber(const std::string& text, size_t offset) {
    return 1 + static_cast<size_t>(std::count(text.begin(), text.begin() + std::min(offset, text.size()), '\n'));
}

// Start of the line when only indentation precedes `pos`, else `pos`
size_t lineStartIfIndented(const std::string& text, size_t pos) {
    size_t b = pos;
    while (b > 0 && (text[b - 1] == ' ' || text[b - 1] == '\t')) --b;
    return (b == 0 || text[b - 1] == '\n') ? b : pos;
}

class Parser {
public:
    explicit Parser(Document& doc) : m_doc(doc) {}

    Status run() {
        Status s = tokenize();
        if (!s) return s;
        s = parsePairs(0);
        if (!s) return s;
        if (m_pos < m_doc.tokens.size()) {
            return fail(m_doc.tokens[m_pos].begin, "unexpected '}'");
        }
        return Status::success();
    }

private:
    Status fail(size_t offset, const std::string& what) const {
        return Status::failure(ErrorKind::PatchNotApplied,
                               "parse error at line " + std::to_string(lineNumber(m_doc.text, offset)) + ": " + what);
    }

    void push(Token::Type type, size_t begin, size_t end, bool quoted = false) {
        Token t;
        t.type = type;
        t.begin = begin;
        t.end = end;
        t.quoted = quoted;
        m_doc.tokens.push_back(t);
    }

    Status tokenize() {
        const std::string& s = m_doc.text;
        const size_t n = s.size();
        size_t i = 0;
        while (i < n) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                ++i;
                continue;
            }
            if (c == '/' && i + 1 < n && s[i + 1] == '/') {
                i = s.find('\n', i);
                if (i == std::string::npos) i = n;
                continue;
            }
            if (c == '{') {
                push(Token::Type::OpenBrace, i, i + 1);
                ++i;
                continue;
            }
            if (c == '}') {
                push(Token::Type::CloseBrace, i, i + 1);
                ++i;
                continue;
            }
            if (c == '"') {
                size_t j = i + 1;
                while (j < n && s[j] != '"') {
                    j += (s[j] == '\\' && j + 1 < n) ? 2 : 1;
                }
                if (j >= n) {
                    return fail(i, "unterminated quoted string");
                }
                push(Token::Type::String, i, j + 1, true);
                i = j + 1;
                continue;
            }
            if (c == '[' && i + 1 < n && (s[i + 1] == '$' || s[i + 1] == '!')) {
                size_t close = s.find(']', i);
                size_t eol = s.find('\n', i);
                if (close == std::string::npos || (eol != std::string::npos && eol < close)) {
                    return fail(i, "unterminated condition");
                }
                push(Token::Type::Condition, i, close + 1);
                i = close + 1;
                continue;
            }
            size_t j = i;
            while (j < n && !std::isspace(static_cast<unsigned char>(s[j])) &&
                   s[j] != '"' && s[j] != '{' && s[j] != '}') {
                ++j;
            }
            push(Token::Type::String, i, j);
            i = j;
        }
        return Status::success();
    }

    void skipConditions() {
        while (m_pos < m_doc.tokens.size() && m_doc.tokens[m_pos].type == Token::Type::Condition) ++m_pos;
    }

    Status parsePairs(int depth) {
        auto& tokens = m_doc.tokens;
        if (depth > kMaxDepth) {
            return fail(tokens[m_pos - 1].begin, "nesting deeper than " + std::to_string(kMaxDepth) + " levels");
        }

        while (m_pos < tokens.size()) {
            const Token& t = tokens[m_pos];
            switch (t.type) {
                case Token::Type::Condition:
                    ++m_pos;
                    continue;
                case Token::Type::CloseBrace:
                    if (depth == 0) return fail(t.begin, "unexpected '}'");
                    return Status::success();
                case Token::Type::OpenBrace: {
                    size_t open = m_pos++;
                    Status s = parsePairs(depth + 1);
                    if (!s) return s;
                    if (m_pos >= tokens.size()) return fail(tokens[open].begin, "'{' is never closed");
                    ++m_pos;
                    continue;
                }
                case Token::Type::String:
                    break;
            }

            size_t keyIndex = m_pos++;
            tokens[keyIndex].isKey = true;
            skipConditions();
            if (m_pos >= tokens.size() || tokens[m_pos].type == Token::Type::CloseBrace) {
                return fail(tokens[keyIndex].begin, "key '" + m_doc.tokenText(tokens[keyIndex]) + "' has no value");
            }

            if (tokens[m_pos].type == Token::Type::String) {
                ++m_pos;
                continue;
            }

            const Token& key = tokens[keyIndex];
            BlockSpan block;
            block.key = m_doc.tokenText(key);
            block.quotedKey = key.quoted;
            block.keyPos = key.begin;
            block.begin = lineStartIfIndented(m_doc.text, key.begin);
            block.startsLine = block.begin == 0 || m_doc.text[block.begin - 1] == '\n';
            block.openBrace = tokens[m_pos].begin;
            block.depth = depth;
            block.bodyFirstToken = m_pos + 1;
            size_t blockIndex = m_doc.blocks.size();
            m_doc.blocks.push_back(block);

            ++m_pos;
            Status s = parsePairs(depth + 1);
            if (!s) return s;
            if (m_pos >= tokens.size()) {
                return fail(key.begin, "block '" + block.key + "' is never closed");
            }
            BlockSpan& done = m_doc.blocks[blockIndex];
            done.bodyEndToken = m_pos;
            done.end = tokens[m_pos].end;
            ++m_pos;
        }
        return Status::success();
    }

    Document& m_doc;
    size_t m_pos = 0;
};

// Replacement text as inserted: normalized, no leading blank lines, no
// trailing whitespace
std::string prepareReplacement(const std::string& replacement) {
    std::string r = normalize(replacement);
    size_t pos = 0;
    while (true) {
        size_t nl = r.find('\n', pos);
        if (nl == std::string::npos) break;
        if (r.find_first_not_of(" \t", pos) < nl) break;
        pos = nl + 1;
    }
    r.erase(0, pos);
    size_t last = r.find_last_not_of(" \t\n");
    if (last == std::string::npos) return "";
    r.erase(last + 1);
    return r;
}

// The replacement must be exactly one block keyed `id`
Status checkReplacement(const std::string& prepared, const std::string& id) {
    if (prepared.empty()) {
        return Status::failure(ErrorKind::PatchNotApplied, "replacement for block " + id + " is empty");
    }
    auto parsed = parse(prepared);
    if (!parsed) {
        return Status::failure(ErrorKind::PatchNotApplied,
                               "replacement for block " + id + " is malformed: " + parsed.message());
    }
    const Document& doc = parsed.value();
    if (doc.blocks.empty() || doc.blocks[0].key != id || doc.tokens.empty() ||
        doc.tokens[0].begin != doc.blocks[0].keyPos || doc.blocks[0].end != prepared.size()) {
        return Status::failure(ErrorKind::PatchNotApplied,
                               "replacement for block " + id + " must contain exactly that one block");
    }
    return Status::success();
}

// When the matched span starts mid-line the replacement's own indentation
// would end up inside the line
std::string fitToSpan(std::string prepared, const BlockSpan& span) {
    if (!span.startsLine) {
        size_t first = prepared.find_first_not_of(" \t");
        if (first != std::string::npos) prepared.erase(0, first);
    }
    return prepared;
}

void emitPairs(const Document& doc, size_t& pos, int depth, std::string& out) {
    const auto& tokens = doc.tokens;
    const std::string indent(static_cast<size_t>(depth), '\t');
    auto raw = [&](const Token& t) {
        std::string text = doc.text.substr(t.begin, t.end - t.begin);
        return t.quoted ? text : "\"" + text + "\"";
    };
    auto conditions = [&]() {
        std::string cond;
        while (pos < tokens.size() && tokens[pos].type == Token::Type::Condition) {
            cond += " " + doc.text.substr(tokens[pos].begin, tokens[pos].end - tokens[pos].begin);
            ++pos;
        }
        return cond;
    };

    while (pos < tokens.size()) {
        const Token& t = tokens[pos];
        if (t.type == Token::Type::CloseBrace) return;
        if (t.type == Token::Type::Condition) {
            ++pos;
            continue;
        }
        if (t.type == Token::Type::OpenBrace) {
            out += indent + "{\n";
            ++pos;
            emitPairs(doc, pos, depth + 1, out);
            out += indent + "}\n";
            ++pos;
            continue;
        }

        std::string key = raw(t);
        ++pos;
        std::string cond = conditions();
        const Token& next = tokens[pos];
        if (next.type == Token::Type::String) {
            std::string value = raw(next);
            ++pos;
            cond += conditions();
            out += indent + key + "\t\t" + value + cond + "\n";
        } else {
            out += indent + key + cond + "\n" + indent + "{\n";
            ++pos;
            emitPairs(doc, pos, depth + 1, out);
            out += indent + "}\n";
            ++pos;
        }
    }
}

} // namespace

Result<Document> parse(std::string text) {
    Document doc;
    doc.text = std::move(text);
    Parser parser(doc);
    Status s = parser.run();
    if (!s) return Result<Document>::failure(s);
    return Result<Document>::success(std::move(doc));
}

// ============================================================================
// Block operations
// ============================================================================

Result<std::optional<std::string>> extractBlock(const std::string& text, const std::string& id,
                                                const std::string& ownerTag) {
    using R = Result<std::optional<std::string>>;
    auto parsed = parse(normalize(text));
    if (!parsed) return R::failure(parsed.error());

    const Document& doc = parsed.value();
    const BlockSpan* block = doc.findBlock(id, ownerTag);
    if (!block) return R::success(std::nullopt);
    return R::success(doc.blockText(*block));
}

Result<ReplaceOutcome> replaceBlock(const std::string& original, const std::string& id,
                                    const std::string& replacement, const std::string& ownerTag) {
    using R = Result<ReplaceOutcome>;
    std::string prepared = prepareReplacement(replacement);
    Status check = checkReplacement(prepared, id);
    if (!check) return R::failure(check);

    const std::string text = normalize(original);
    auto parsed = parse(text);
    if (!parsed) return R::failure(parsed.error());
    const Document& doc = parsed.value();

    ReplaceOutcome outcome;
    const BlockSpan* block = doc.findBlock(id, ownerTag);
    if (!block) {
        outcome.text = text;
        return R::success(std::move(outcome));
    }

    prepared = fitToSpan(std::move(prepared), *block);
    outcome.text.reserve(text.size() + prepared.size());
    outcome.text.append(text, 0, block->begin);
    outcome.text += prepared;
    outcome.text.append(text, block->end, std::string::npos);
    outcome.replaced = true;
    return R::success(std::move(outcome));
}

Result<BlockMap> parseBlocks(const std::string& text) {
    auto parsed = parse(normalize(text));
    if (!parsed) return Result<BlockMap>::failure(parsed.error());
    const Document& doc = parsed.value();

    BlockMap blocks;
    size_t insideUntil = 0;
    for (const auto& block : doc.blocks) {
        if (block.begin < insideUntil) continue;
        if (!block.isNumeric()) continue;
        blocks[block.key] = doc.blockText(block);
        insideUntil = block.end;
    }
    return Result<BlockMap>::success(std::move(blocks));
}

bool isOneLiner(const std::string& text) {
    size_t lines = 1 + static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    return lines < 100 && text.size() > 10000;
}

Result<std::string> prettify(const std::string& text) {
    auto parsed = parse(normalize(text));
    if (!parsed) return Result<std::string>::failure(parsed.error());

    std::string out;
    out.reserve(text.size() + text.size() / 4);
    size_t pos = 0;
    emitPairs(parsed.value(), pos, 0, out);
    return Result<std::string>::success(std::move(out));
}

Result<PatchReport> applyPatches(const std::string& original, const BlockMap& index,
                                 const std::vector<PatchRequest>& requests,
                                 const PatchOptions& options) {
    using R = Result<PatchReport>;
    const std::string text = normalize(original);
    auto parsed = parse(text);
    if (!parsed) return R::failure(parsed.error());
    const Document& doc = parsed.value();

    struct Edit {
        size_t begin;
        size_t end;
        std::string text;
        std::string id;
        bool append;
    };
    std::vector<Edit> edits;
    PatchReport report;

    for (const auto& request : requests) {
        auto found = index.find(request.id);
        if (found == index.end()) {
            report.missing.push_back(request.id + ": not present in the patch index");
            continue;
        }

        std::string prepared = prepareReplacement(found->second);
        Status check = checkReplacement(prepared, request.id);
        if (!check) return R::failure(check);

        const BlockSpan* block = doc.findBlock(request.id, request.ownerTag);
        if (block) {
            bool duplicate = std::any_of(edits.begin(), edits.end(), [&](const Edit& e) {
                return !e.append && e.begin == block->begin && e.end == block->end;
            });
            if (duplicate) continue;
            edits.push_back({block->begin, block->end, fitToSpan(prepared, *block), request.id, false});
            continue;
        }

        std::string reason = request.ownerTag.empty()
            ? "no matching block"
            : "no matching block owned by " + request.ownerTag;
        if (!options.appendMissing) {
            report.missing.push_back(request.id + ": " + reason);
            continue;
        }

        const BlockSpan* section = doc.findSection(options.appendSection);
        if (!section) {
            report.missing.push_back(request.id + ": " + reason + " and no '" + options.appendSection +
                                     "' section to append to");
            continue;
        }
        size_t bracePos = doc.tokens[section->bodyEndToken].begin;
        size_t insertAt = lineStartIfIndented(doc.text, bracePos);
        std::string inserted = (insertAt == bracePos) ? "\n" + prepared + "\n" : prepared + "\n";
        edits.push_back({insertAt, insertAt, inserted, request.id, true});
    }

    std::stable_sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) { return a.begin < b.begin; });
    for (size_t i = 1; i < edits.size(); ++i) {
        if (edits[i - 1].end > edits[i].begin) {
            return R::failure(ErrorKind::PatchNotApplied,
                              "blocks " + edits[i - 1].id + " and " + edits[i].id + " overlap");
        }
    }

    size_t cursor = 0;
    report.text.reserve(text.size());
    for (const auto& edit : edits) {
        report.text.append(text, cursor, edit.begin - cursor);
        report.text += edit.text;
        cursor = edit.end;
        (edit.append ? report.appended : report.applied).push_back(edit.id);
    }
    report.text.append(text, cursor, std::string::npos);

    Console::debug("Patched ", report.applied.size(), " block(s), appended ", report.appended.size(),
                   ", missing ", report.missing.size());
    return R::success(std::move(report));
}

} // namespace KeyValues
} // namespace PakForge
