#include "rougel/Corpus.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rougel::corpus {

namespace {

const char* const kLevelNames[] = {
    "Basic Text",
    "Structured Text",
    "JSON Data",
    "HTML Content",
    "Mixed Content",
    "Real-world Scenarios"
};

Example make(int level, std::string candidate, std::string reference) {
    return Example{level, levelName(level), std::move(candidate), std::move(reference)};
}

std::string optionalText(const json& entry, const char* key, size_t index) {
    if (!entry.contains(key) || entry[key].is_null()) return {};
    if (!entry[key].is_string()) {
        throw std::runtime_error("example " + std::to_string(index) + ": '" + key + "' must be a string");
    }
    return entry[key].get<std::string>();
}

} // namespace

std::string levelName(int level) {
    if (level >= 1 && level <= 6) return kLevelNames[level - 1];
    return "Level " + std::to_string(level);
}

const std::vector<Example>& builtinExamples() {
    static const std::vector<Example> examples = {
        make(1, "The quick brown fox jumps over the lazy dog",
                "A quick brown fox jumps over a lazy dog"),
        make(1, "Machine learning is a subset of artificial intelligence",
                "Machine learning forms part of artificial intelligence systems"),

        make(2, "Key features include: security authentication and data encryption",
                "Main features are: authentication security and encryption of data"),
        make(2, "User name: John Doe, Email: john@example.com, Status: Active",
                "Name: John Doe, Email address: john@example.com, Status: Active user"),

        make(3, R"({"user": {"name": "Alice", "age": 30, "city": "New York"}})",
                R"({"user": {"name": "Alice", "age": 30, "location": "New York"}})"),
        make(3, R"({"employees": [{"id": 1, "name": "Bob"}, {"id": 2, "name": "Charlie"}]})",
                R"({"staff": [{"id": 1, "name": "Bob"}, {"id": 2, "name": "Charlie"}]})"),
        make(3, R"({"status": "success", "data": {"count": 42, "items": ["a", "b"]}})",
                R"({"result": "success", "payload": {"total": 42, "list": ["a", "b"]}})"),

        make(4, "<div><h1>Title</h1><p>Content here</p></div>",
                "<section><h1>Title</h1><p>Content here</p></section>"),
        make(4, R"(<a href="/page">Link</a> <img src="photo.jpg" alt="Image">)",
                R"(<a href="/page">Link</a> <img src="photo.jpg" alt="Photo">)"),
        make(4, "<ul><li>Item 1</li><li>Item 2</li><li>Item 3</li></ul>",
                "<ol><li>Item 1</li><li>Item 2</li><li>Item 3</li></ol>"),

        make(5, R"(The API returned {"status": 200, "message": "OK"} with user data)",
                R"(API response was {"status": 200, "message": "OK"} containing user information)"),
        make(5, R"(Error: {"code": 404, "error": "Not Found"} occurred at 2024-01-15)",
                R"(Error occurred: {"code": 404, "error": "Not Found"} on date 2024-01-15)"),

        make(6, "Natural language processing enables computers to understand human language through advanced algorithms",
                "NLP allows machines to comprehend natural human communication using sophisticated algorithmic approaches"),
        make(6, "The cat sat on the mat while the dog played in the yard",
                "The dog played in the yard while the cat sat on the mat"),
        make(6, "POST /api/users HTTP/1.1\nHost: api.example.com\nContent-Type: application/json\n{\"name\": \"Test\"}",
                "POST /api/users HTTP/1.1\nHost: api.example.com\nContent-Type: application/json\n{\"username\": \"Test\"}"),
        make(6, "<html><body><script>console.log('Hello');</script><div>Content</div></body></html>",
                "<html><body><div>Content</div><script>console.log('Hello');</script></body></html>")
    };
    return examples;
}

std::vector<Example> loadExamples(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open corpus file " + path);
    }

    json root;
    try {
        in >> root;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("corpus parse error in " + path + ": " + e.what());
    }

    const json* list = &root;
    if (root.is_object()) {
        if (!root.contains("examples")) {
            throw std::runtime_error("corpus " + path + " has no 'examples' array");
        }
        list = &root["examples"];
    }
    if (!list->is_array()) {
        throw std::runtime_error("corpus " + path + " must be a JSON array of examples");
    }

    std::vector<Example> out;
    out.reserve(list->size());
    for (size_t i = 0; i < list->size(); ++i) {
        const json& entry = (*list)[i];
        if (!entry.is_object()) {
            throw std::runtime_error("example " + std::to_string(i) + " is not an object");
        }
        Example ex;
        if (entry.contains("level")) {
            if (!entry["level"].is_number_integer()) {
                throw std::runtime_error("example " + std::to_string(i) + ": 'level' must be an integer");
            }
            ex.level = entry["level"].get<int>();
        }
        ex.candidate = optionalText(entry, "candidate", i);
        ex.reference = optionalText(entry, "reference", i);
        ex.levelName = optionalText(entry, "level_name", i);
        if (ex.levelName.empty()) ex.levelName = levelName(ex.level);
        out.push_back(std::move(ex));
    }
    std::cerr << "Corpus: loaded " << out.size() << " examples from " << path << "\n";
    return out;
}

} // namespace rougel::corpus
