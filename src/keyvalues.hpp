#pragma once

#include "errors.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PakForge {
namespace KeyValues {

// Canonicalize text produced by assorted authoring tools before parsing:
// strips the BOM and zero-width characters, converts CRLF/CR to LF, curly
// quotes to ASCII quotes and non-breaking spaces to plain spaces.
// normalize(normalize(x)) == normalize(x) for any input.
std::string normalize(const std::string& text);

// A keyed block located in a document. Offsets index the scanned text.
struct BlockSpan {
    std::string key;
    bool quotedKey = false;
    size_t keyPos = 0;      // opening quote (or first char) of the key
    size_t begin = 0;       // start of the key's line when only indentation precedes it, else keyPos
    bool startsLine = true; // false when other tokens precede the key on its line
    size_t openBrace = 0;
    size_t end = 0;         // one past the closing brace
    int depth = 0;          // 0 = top level
    size_t bodyFirstToken = 0;
    size_t bodyEndToken = 0;

    bool isNumeric() const;
};

struct Token {
    enum class Type { String, OpenBrace, CloseBrace, Condition };
    Type type = Type::String;
    size_t begin = 0;       // first byte of the token (the quote for quoted strings)
    size_t end = 0;         // one past the last byte
    bool quoted = false;
    bool isKey = false;

    size_t textBegin() const { return quoted ? begin + 1 : begin; }
    size_t textLength() const { return quoted ? end - begin - 2 : end - begin; }
};

struct Document {
    std::string text;
    std::vector<Token> tokens;
    std::vector<BlockSpan> blocks;   // pre-order: a block precedes its children

    std::string tokenText(const Token& token) const;
    std::string blockText(const BlockSpan& block) const;
    bool hasNestedKey(const BlockSpan& block, const std::string& key) const;

    // First numeric block keyed `id`; with an owner tag, the first one whose
    // body contains the tag as a key at any depth
    const BlockSpan* findBlock(const std::string& id, const std::string& ownerTag = "") const;
    const BlockSpan* findSection(const std::string& name) const;
};

// Tokenize and parse. Unterminated quotes and unbalanced braces are errors
// (PatchNotApplied); the parser never guesses at malformed input.
Result<Document> parse(std::string text);

// The block operations below normalize their input before parsing; offsets
// and returned text refer to the normalized document.

// Full text of a block including its delimiters, or nullopt when absent
Result<std::optional<std::string>> extractBlock(const std::string& text, const std::string& id,
                                                const std::string& ownerTag = "");

struct ReplaceOutcome {
    std::string text;
    bool replaced = false;
};

// Substitute the matched block with `replacement` (normalized, leading blank
// lines and trailing whitespace removed). Bytes outside the matched span are
// left untouched. replaced == false when no block matched.
Result<ReplaceOutcome> replaceBlock(const std::string& text, const std::string& id,
                                    const std::string& replacement,
                                    const std::string& ownerTag = "");

using BlockMap = std::map<std::string, std::string>;

// id -> block text for every numeric block not nested inside another numeric
// block. Non-numeric keys are section headers and are descended into.
Result<BlockMap> parseBlocks(const std::string& text);

// Fewer than 100 lines yet more than 10000 bytes
bool isOneLiner(const std::string& text);

// Re-emit the document one key per line with tab indentation
Result<std::string> prettify(const std::string& text);

struct PatchRequest {
    std::string id;
    std::string ownerTag;
};

struct PatchOptions {
    bool appendMissing = false;
    std::string appendSection = "items";
};

struct PatchReport {
    std::string text;
    std::vector<std::string> applied;
    std::vector<std::string> appended;
    std::vector<std::string> missing;    // "id: reason"
};

// Apply many replacements from a patch index in one parse of `text`
Result<PatchReport> applyPatches(const std::string& text, const BlockMap& index,
                                 const std::vector<PatchRequest>& requests,
                                 const PatchOptions& options = {});

} // namespace KeyValues
} // namespace PakForge
