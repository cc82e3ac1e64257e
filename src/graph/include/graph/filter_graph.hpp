#pragma once
#include "core/result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tlc::graph {

enum class StreamType { Video, Audio };

// Opaque pin handle. Only the graph that allocated it can render its name.
class Label {
public:
    Label() = default;
    bool valid() const { return id_ != 0; }
    uint32_t id() const { return id_; }
    bool operator==(const Label& o) const { return id_ == o.id_; }
    bool operator!=(const Label& o) const { return id_ != o.id_; }

private:
    friend class FilterGraph;
    explicit Label(uint32_t id) : id_(id) {}
    uint32_t id_ = 0;
};

// One emitted stage: [in0][in1]chain[out]
struct Node {
    std::vector<Label> inputs;
    std::string chain;
    Label output;
};

class FilterGraph {
public:
    FilterGraph() = default;

    // Pin for an engine input stream, rendered "N:v" / "N:a". Repeated requests return the same pin.
    Label input(int file_index, StreamType type);

    // Appends a stage consuming `inputs` and returns its freshly allocated output.
    Label add(std::vector<Label> inputs, std::string chain, const std::string& hint = "s");
    Label source(std::string chain, const std::string& hint = "src") { return add({}, std::move(chain), hint); }
    Label append(Label in, std::string chain, const std::string& hint = "s") { return add({in}, std::move(chain), hint); }

    // Gives an output pin a stable public name ("video", "audio"). Names may not end in a digit.
    [[nodiscard]] bool export_as(Label label, const std::string& name);

    const std::vector<Node>& nodes() const { return nodes_; }
    const Node* producer(Label label) const;
    bool is_input(Label label) const;
    std::string name_of(Label label) const;

    // One string per stage in emission order, and the ';' joined form for -filter_complex.
    std::vector<std::string> render() const;
    std::string render_joined() const;

    // Every pin produced before it is consumed, consumed at most once, and either consumed or exported.
    [[nodiscard]] core::VoidResult validate() const;

    std::size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    struct Pin {
        bool engine_input = false;
        int file_index = -1;
        StreamType type = StreamType::Video;
        std::string hint;
        std::string exported;
        std::size_t producer = 0;   // node index + 1, 0 for engine inputs
    };

    Label allocate(Pin pin);
    const Pin* pin(Label label) const;

    std::vector<Pin> pins_;   // pins_[id - 1]
    std::vector<Node> nodes_;
};

} // namespace tlc::graph
