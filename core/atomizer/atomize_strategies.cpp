#include "atomizer/atomize_strategy.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace arbor {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isPunct(char c) {
    return std::ispunct(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && isSpace(s[begin])) begin++;
    size_t end = s.size();
    while (end > begin && isSpace(s[end - 1])) end--;
    return s.substr(begin, end - begin);
}

size_t countTokens(const std::string& s) {
    std::istringstream iss(s);
    std::string tok;
    size_t n = 0;
    while (iss >> tok) n++;
    return n;
}

} // namespace

// ─── WordStrategy ─────────────────────────────────────────────

std::vector<UnitPayload> WordStrategy::split(const std::string& raw) const {
    std::vector<UnitPayload> out;
    std::istringstream iss(raw);
    std::string tok;
    while (iss >> tok) {
        size_t begin = 0;
        while (begin < tok.size() && isPunct(tok[begin])) begin++;
        size_t end = tok.size();
        while (end > begin && isPunct(tok[end - 1])) end--;
        if (end > begin) {
            out.push_back(TokenValue{tok.substr(begin, end - begin)});
        }
    }
    return out;
}

// ─── SentenceStrategy ─────────────────────────────────────────

std::vector<UnitPayload> SentenceStrategy::split(const std::string& raw) const {
    std::vector<UnitPayload> out;
    std::string current;

    auto flush = [&]() {
        std::string s = trim(current);
        current.clear();
        // Bare terminators ("...", "?!") carry nothing.
        bool has_content = false;
        for (char c : s) {
            if (!isPunct(c) && !isSpace(c)) { has_content = true; break; }
        }
        if (has_content) {
            size_t n = countTokens(s);
            out.push_back(SentenceValue{std::move(s), n});
        }
    };

    for (size_t i = 0; i < raw.size(); i++) {
        char c = raw[i];
        current.push_back(c);
        if (c == '.' || c == '!' || c == '?') {
            bool at_end = (i + 1 == raw.size());
            if (at_end || isSpace(raw[i + 1])) {
                flush();
            }
        }
    }
    flush();
    return out;
}

// ─── FieldStrategy ────────────────────────────────────────────

std::vector<UnitPayload> FieldStrategy::split(const std::string& raw) const {
    std::vector<UnitPayload> out;
    std::istringstream iss(raw);
    std::string line;
    int line_no = 0;
    while (std::getline(iss, line)) {
        line_no++;
        std::string t = trim(line);
        if (t.empty()) continue;

        size_t eq = t.find('=');
        size_t colon = t.find(':');
        size_t sep = std::min(eq, colon);
        if (sep == std::string::npos) {
            throw InvalidInputError("field line " + std::to_string(line_no) +
                                    " has no separator: '" + t + "'");
        }
        std::string key = trim(t.substr(0, sep));
        std::string value = trim(t.substr(sep + 1));
        if (key.empty()) {
            throw InvalidInputError("field line " + std::to_string(line_no) +
                                    " has an empty key");
        }
        out.push_back(FieldValue{std::move(key), std::move(value)});
    }
    return out;
}

// ─── Factory ──────────────────────────────────────────────────

std::unique_ptr<AtomizeStrategy> makeAtomizeStrategy(const std::string& name) {
    if (name == "word") return std::make_unique<WordStrategy>();
    if (name == "sentence") return std::make_unique<SentenceStrategy>();
    if (name == "field") return std::make_unique<FieldStrategy>();
    throw InvalidInputError("unknown atomize strategy: '" + name + "'");
}

std::vector<std::string> atomizeStrategyNames() {
    return {"word", "sentence", "field"};
}

} // namespace arbor
