#include <kgrag/kg/identity.h>
#include <kgrag/kg/mention_linker.h>

#include <algorithm>
#include <cctype>

namespace kgrag::kg {

namespace {

bool isWordChar(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '-';
}

bool isAscii(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

void addPrior(std::vector<std::pair<std::string, double>>& entries, const std::string& nodeId,
              double prior) {
    for (auto& [id, p] : entries) {
        if (id == nodeId) {
            p = std::max(p, prior);
            return;
        }
    }
    entries.emplace_back(nodeId, prior);
}

} // namespace

std::string MentionLinker::normalize(std::string_view s) {
    auto lowered = toLowerAscii(canonicalize(s));
    std::string_view view(lowered);
    while (!view.empty() && static_cast<unsigned char>(view.front()) < 0x80 &&
           !std::isalnum(static_cast<unsigned char>(view.front())))
        view.remove_prefix(1);
    while (!view.empty() && static_cast<unsigned char>(view.back()) < 0x80 &&
           !std::isalnum(static_cast<unsigned char>(view.back())))
        view.remove_suffix(1);
    return std::string(view);
}

std::string MentionLinker::singularize(const std::string& s) {
    if (s.size() > 3 && s.compare(s.size() - 3, 3, "ies") == 0)
        return s.substr(0, s.size() - 3) + "y";
    if (s.size() > 3 && s.back() == 's' && s[s.size() - 2] != 's')
        return s.substr(0, s.size() - 1);
    return s;
}

std::vector<MentionLinker::TokenSpan> MentionLinker::tokenize(std::string_view text) {
    std::vector<TokenSpan> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !isWordChar(static_cast<unsigned char>(text[i])))
            ++i;
        if (i >= text.size())
            break;
        const std::size_t start = i;
        std::string tok;
        while (i < text.size() && isWordChar(static_cast<unsigned char>(text[i])))
            tok.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i++]))));
        tokens.push_back({std::move(tok), start, i});
    }
    return tokens;
}

Result<void> MentionLinker::addAlias(const MentionAlias& entry) {
    if (entry.alias.empty() || entry.nodeId.empty()) {
        return Error{ErrorCode::InvalidArgument, "alias and nodeId must be non-empty"};
    }
    if (entry.prior < 0.0 || entry.prior > 1.0) {
        return Error{ErrorCode::InvalidArgument, "prior must be within [0,1]"};
    }
    auto norm = normalize(entry.alias);
    if (norm.empty()) {
        return Error{ErrorCode::InvalidArgument, "alias has no linkable characters"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& table = isAscii(norm) ? asciiAliases_ : wideAliases_;
    addPrior(table[norm], entry.nodeId, clamp01(entry.prior));
    return {};
}

Result<void> MentionLinker::addNodes(const std::vector<KgNode>& nodes, double prior) {
    for (const auto& node : nodes) {
        if (node.id.empty())
            continue;
        if (!normalize(node.name).empty()) {
            auto r = addAlias(MentionAlias{node.name, node.id, prior});
            if (!r)
                return r;
        }
        for (const auto& alias : node.aliases) {
            if (normalize(alias).empty())
                continue;
            auto r = addAlias(MentionAlias{alias, node.id, prior});
            if (!r)
                return r;
        }
    }
    return {};
}

void MentionLinker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    asciiAliases_.clear();
    wideAliases_.clear();
}

std::size_t MentionLinker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return asciiAliases_.size() + wideAliases_.size();
}

const MentionLinker::NodePrior* MentionLinker::lookupBest(const std::string& alias) const {
    auto it = asciiAliases_.find(alias);
    if (it == asciiAliases_.end() || it->second.empty())
        return nullptr;
    const NodePrior* best = &it->second.front();
    for (const auto& candidate : it->second) {
        if (candidate.second > best->second ||
            (candidate.second == best->second && candidate.first < best->first))
            best = &candidate;
    }
    return best;
}

Result<std::vector<LinkedMention>> MentionLinker::link(std::string_view text) const {
    if (!config_.isValid()) {
        return Error{ErrorCode::InvalidArgument, "Invalid MentionLinkerConfig"};
    }
    std::vector<LinkedMention> out;
    std::lock_guard<std::mutex> lock(mutex_);

    // Longest-first n-gram matching so shorter phrases never overlap a longer match
    const auto tokens = tokenize(text);
    std::vector<bool> used(tokens.size(), false);
    for (std::size_t n = std::min(config_.maxNgram, tokens.size()); n >= 1; --n) {
        for (std::size_t i = 0; i + n <= tokens.size(); ++i) {
            if (std::any_of(used.begin() + static_cast<std::ptrdiff_t>(i),
                            used.begin() + static_cast<std::ptrdiff_t>(i + n),
                            [](bool u) { return u; }))
                continue;

            std::string phrase;
            for (std::size_t j = 0; j < n; ++j) {
                if (j)
                    phrase.push_back(' ');
                phrase.append(tokens[i + j].token);
            }
            auto norm = normalize(phrase);
            const NodePrior* match = lookupBest(norm);
            if (!match && config_.pluralNormalization) {
                norm = singularize(norm);
                match = lookupBest(norm);
            }
            if (!match || match->second < config_.minConfidence)
                continue;

            LinkedMention m;
            m.start = tokens[i].start;
            m.end = tokens[i + n - 1].end;
            m.text = std::string(text.substr(m.start, m.end - m.start));
            m.nodeId = match->first;
            m.confidence = match->second;
            m.matchedAlias = norm;
            out.push_back(std::move(m));
            std::fill(used.begin() + static_cast<std::ptrdiff_t>(i),
                      used.begin() + static_cast<std::ptrdiff_t>(i + n), true);
        }
        if (n == 1)
            break;
    }

    // Non-ASCII aliases: substring occurrences, first occurrence per node
    if (!wideAliases_.empty()) {
        const auto lowered = toLowerAscii(text);
        for (const auto& [alias, entries] : wideAliases_) {
            const auto pos = lowered.find(alias);
            if (pos == std::string::npos)
                continue;
            for (const auto& [nodeId, prior] : entries) {
                if (prior < config_.minConfidence)
                    continue;
                LinkedMention m;
                m.start = pos;
                m.end = pos + alias.size();
                m.text = std::string(text.substr(pos, alias.size()));
                m.nodeId = nodeId;
                m.confidence = prior;
                m.matchedAlias = alias;
                out.push_back(std::move(m));
            }
        }
    }

    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.start != b.start)
            return a.start < b.start;
        return a.nodeId < b.nodeId;
    });
    return out;
}

} // namespace kgrag::kg
