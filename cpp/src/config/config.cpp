// ==============================================================================
// config.cpp - Файл настроек оценщика (YAML)
// ==============================================================================
//
// Ошибки значений внутри модуля передаются исключением ValueError и
// превращаются в LoadResult на границе parse().
//
// ==============================================================================

#include <cstdint>
#include <sigmaeval/config.hpp>
#include <sigmaeval/discovery.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sigmaeval::config {

namespace {

class ValueError : public std::runtime_error {
public:
    ValueError(std::string key, const std::string& message)
        : std::runtime_error(message), key_(std::move(key)) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (!node || node.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!node.IsMap()) {
        throw ValueError(name, "must be a mapping");
    }
    return node;
}

size_t read_count(const YAML::Node& sec, const std::string& sec_name, const char* key,
                  size_t current) {
    const YAML::Node node = sec[key];
    if (!node) {
        return current;
    }
    int64_t value = 0;
    if (!node.IsScalar() || !YAML::convert<int64_t>::decode(node, value)) {
        throw ValueError(sec_name + "." + key, "must be an integer");
    }
    if (value < 0) {
        throw ValueError(sec_name + "." + key, "must not be negative");
    }
    return static_cast<size_t>(value);
}

double read_ratio(const YAML::Node& sec, const std::string& sec_name, const char* key,
                  double current) {
    const YAML::Node node = sec[key];
    if (!node) {
        return current;
    }
    double value = 0.0;
    if (!node.IsScalar() || !YAML::convert<double>::decode(node, value)) {
        throw ValueError(sec_name + "." + key, "must be a number");
    }
    if (value < 0.0 || value > 1.0) {
        throw ValueError(sec_name + "." + key, "must be between 0 and 1");
    }
    return value;
}

void apply(const YAML::Node& root, Config& c) {
    const YAML::Node sem = section(root, "semantic");
    c.semantic.judge_timeout = std::chrono::milliseconds(static_cast<int64_t>(read_count(
        sem, "semantic", "judge_timeout_ms", static_cast<size_t>(c.semantic.judge_timeout.count()))));
    c.semantic.embed_timeout = std::chrono::milliseconds(static_cast<int64_t>(read_count(
        sem, "semantic", "embed_timeout_ms", static_cast<size_t>(c.semantic.embed_timeout.count()))));
    c.embedding_dimensions =
        read_count(sem, "semantic", "embedding_dimensions", c.embedding_dimensions);
    if (c.embedding_dimensions == 0) {
        throw ValueError("semantic.embedding_dimensions", "must be positive");
    }

    const YAML::Node stab = section(root, "stability");
    c.stability_runs = read_count(stab, "stability", "runs", c.stability_runs);
    c.stable_threshold = read_ratio(stab, "stability", "stable_threshold", c.stable_threshold);

    const YAML::Node nov = section(root, "novelty");
    c.novelty.duplicate_threshold =
        read_ratio(nov, "novelty", "duplicate_threshold", c.novelty.duplicate_threshold);
    c.novelty.variant_threshold =
        read_ratio(nov, "novelty", "variant_threshold", c.novelty.variant_threshold);
    if (c.novelty.variant_threshold > c.novelty.duplicate_threshold) {
        throw ValueError("novelty.variant_threshold", "must not exceed duplicate_threshold");
    }

    const YAML::Node data = section(root, "dataset");
    c.num_threads = read_count(data, "dataset", "num_threads", c.num_threads);
}

}  // namespace

LoadResult parse(const std::string& text) {
    LoadResult result;

    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        result.error = rule::Error{e.what(), "invalid config YAML"};
        return result;
    }

    if (root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = rule::Error{"config must be a YAML mapping", "invalid config"};
        return result;
    }

    try {
        apply(root, result.config);
    } catch (const ValueError& e) {
        result.error = rule::Error{e.what(), e.key()};
        return result;
    } catch (const YAML::Exception& e) {
        result.error = rule::Error{e.what(), "invalid config"};
        return result;
    }

    result.ok = true;
    return result;
}

LoadResult load(const std::filesystem::path& path) {
    auto read = io::read_text_file(path);
    if (!read) {
        LoadResult result;
        result.error = rule::Error{read.error, "config"};
        return result;
    }

    auto result = parse(read.content);
    if (!result) {
        result.error.context = path.string() + ": " + result.error.context;
    }
    return result;
}

}  // namespace sigmaeval::config
