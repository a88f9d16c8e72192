// ==============================================================================
// capability.cpp - Встроенные реализации способностей
// ==============================================================================

#include <cctype>
#include <cmath>
#include <cstdint>
#include <sigmaeval/capability.hpp>
#include <sigmaeval/discovery.hpp>
#include <sigmaeval/output.hpp>
#include <sigmaeval/rule.hpp>

namespace sigmaeval::capability {

// ============================================================================
// HashingEmbedder
// ============================================================================

namespace {

// FNV-1a 64
uint64_t fnv1a(const std::string& s) {
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

}  // namespace

HashingEmbedder::HashingEmbedder(size_t dimensions) : dimensions_(dimensions == 0 ? 1 : dimensions) {}

std::vector<float> HashingEmbedder::embed(const std::string& text) {
    std::vector<float> vec(dimensions_, 0.0f);

    auto add_token = [&](const std::string& token) {
        uint64_t h = fnv1a(token);
        size_t index = static_cast<size_t>(h % dimensions_);
        float sign = ((h >> 63) & 1u) != 0 ? -1.0f : 1.0f;
        vec[index] += sign;
    };

    std::string token;
    for (char c : text) {
        auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '_') {
            token += static_cast<char>(std::tolower(u));
        } else if (!token.empty()) {
            add_token(token);
            token.clear();
        }
    }
    if (!token.empty()) {
        add_token(token);
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const auto scale = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& v : vec) {
            v *= scale;
        }
    }
    return vec;
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        throw CapabilityError("embedding dimensions differ (" + std::to_string(a.size()) + " vs " +
                              std::to_string(b.size()) + ")");
    }

    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) {
        throw CapabilityError("embedding has zero norm");
    }
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

// ============================================================================
// MemoryCorpus
// ============================================================================

MemoryCorpus::MemoryCorpus(std::vector<CorpusRule> rules) : rules_(std::move(rules)) {}

void MemoryCorpus::add(CorpusRule rule) {
    rules_.push_back(std::move(rule));
}

std::vector<CorpusRule> MemoryCorpus::rules() const {
    return rules_;
}

// ============================================================================
// DirectoryCorpus
// ============================================================================

DirectoryCorpus::DirectoryCorpus(const std::filesystem::path& root, output::Writer* writer) {
    io::DiscoveryOptions opt;
    opt.skip_errors = true;
    opt.writer = writer;

    for (const auto& path : io::discover_files({root}, opt)) {
        auto read = io::read_text_file(path);
        if (!read) {
            ++skipped_;
            if (writer) {
                writer->warn(read.error);
            }
            continue;
        }

        CorpusRule entry;
        entry.id = path.stem().string();
        entry.rule_text = std::move(read.content);

        auto parsed = rule::parse(entry.rule_text);
        if (parsed) {
            if (parsed.rule.id && !parsed.rule.id->empty()) {
                entry.id = *parsed.rule.id;
            }
            entry.title = parsed.rule.title;
        }

        rules_.push_back(std::move(entry));
    }

    if (writer) {
        writer->debug("Loaded " + std::to_string(rules_.size()) + " corpus rule(s) from " +
                      root.string());
    }
}

std::vector<CorpusRule> DirectoryCorpus::rules() const {
    return rules_;
}

}  // namespace sigmaeval::capability
