#include "graph/filter_graph.hpp"
#include "core/log_config.hpp"
#include <cctype>
#include <map>

namespace tlc::graph {

namespace {

std::string sanitize_hint(const std::string& hint) {
    std::string out;
    for (char c : hint) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') out += c;
    }
    if (out.empty()) out = "s";
    return out;
}

} // namespace

Label FilterGraph::allocate(Pin p) {
    pins_.push_back(std::move(p));
    return Label(static_cast<uint32_t>(pins_.size()));
}

const FilterGraph::Pin* FilterGraph::pin(Label label) const {
    if (!label.valid() || label.id() > pins_.size()) return nullptr;
    return &pins_[label.id() - 1];
}

Label FilterGraph::input(int file_index, StreamType type) {
    for (std::size_t i = 0; i < pins_.size(); ++i) {
        const auto& p = pins_[i];
        if (p.engine_input && p.file_index == file_index && p.type == type) {
            return Label(static_cast<uint32_t>(i + 1));
        }
    }
    Pin p;
    p.engine_input = true;
    p.file_index = file_index;
    p.type = type;
    return allocate(std::move(p));
}

Label FilterGraph::add(std::vector<Label> inputs, std::string chain, const std::string& hint) {
    Pin p;
    p.hint = sanitize_hint(hint);
    p.producer = nodes_.size() + 1;
    Label out = allocate(std::move(p));
    TLC_GRAPH_DEBUG("[FilterGraph::add] " + chain + " -> " + name_of(out));
    nodes_.push_back(Node{std::move(inputs), std::move(chain), out});
    return out;
}

bool FilterGraph::export_as(Label label, const std::string& name) {
    auto idx = label.id();
    if (!label.valid() || idx > pins_.size() || pins_[idx - 1].engine_input) {
        log::error("FilterGraph: cannot export unknown or engine input pin as '" + name + "'");
        return false;
    }
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.back()))) {
        log::error("FilterGraph: export name '" + name + "' must not be empty or end in a digit");
        return false;
    }
    for (const auto& p : pins_) {
        if (p.exported == name) {
            log::error("FilterGraph: export name '" + name + "' already used");
            return false;
        }
    }
    pins_[idx - 1].exported = name;
    return true;
}

const Node* FilterGraph::producer(Label label) const {
    const Pin* p = pin(label);
    if (!p || p->producer == 0) return nullptr;
    return &nodes_[p->producer - 1];
}

bool FilterGraph::is_input(Label label) const {
    const Pin* p = pin(label);
    return p && p->engine_input;
}

std::string FilterGraph::name_of(Label label) const {
    const Pin* p = pin(label);
    if (!p) return "invalid";
    if (p->engine_input) {
        return std::to_string(p->file_index) + (p->type == StreamType::Video ? ":v" : ":a");
    }
    if (!p->exported.empty()) return p->exported;
    // Generated names always end in the pin id, exported ones never do
    return p->hint + std::to_string(label.id());
}

std::vector<std::string> FilterGraph::render() const {
    std::vector<std::string> out;
    out.reserve(nodes_.size());
    for (const auto& n : nodes_) {
        std::string s;
        for (const auto& in : n.inputs) s += "[" + name_of(in) + "]";
        s += n.chain;
        s += "[" + name_of(n.output) + "]";
        out.push_back(std::move(s));
    }
    return out;
}

std::string FilterGraph::render_joined() const {
    std::string joined;
    for (const auto& s : render()) {
        if (!joined.empty()) joined += ';';
        joined += s;
    }
    return joined;
}

core::VoidResult FilterGraph::validate() const {
    std::map<uint32_t, std::size_t> consumed;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const auto& n = nodes_[i];
        if (n.chain.empty()) {
            return core::Error<bool>("stage " + std::to_string(i) + " has an empty filter chain");
        }
        for (const auto& in : n.inputs) {
            const Pin* p = pin(in);
            if (!p) {
                return core::Error<bool>("stage " + std::to_string(i) + " consumes an unknown label");
            }
            if (!p->engine_input) {
                if (p->producer == 0 || p->producer - 1 >= i) {
                    return core::Error<bool>("label [" + name_of(in) + "] used before it is produced");
                }
                if (++consumed[in.id()] > 1) {
                    return core::Error<bool>("label [" + name_of(in) + "] consumed more than once");
                }
            }
        }
    }
    for (const auto& n : nodes_) {
        const Pin* p = pin(n.output);
        if (p->exported.empty() && consumed.find(n.output.id()) == consumed.end()) {
            return core::Error<bool>("label [" + name_of(n.output) + "] is never consumed");
        }
    }
    return core::Ok();
}

} // namespace tlc::graph
