#pragma once
#include "core/geometry.hpp"
#include "graph/filter_graph.hpp"
#include "hw/profile.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tlc::hw {

struct ScaleOptions {
    bool pad = true;                 // letterbox to the exact target size
    std::string pad_color = "black";
    std::string pad_format;          // e.g. yuva420p so a transparent pad keeps its alpha
    bool reset_sar = false;          // append setsar=1 to the same stage
};

struct OverlayPlacement {
    std::string x = "(W-w)/2";
    std::string y = "(H-h)/2";
    std::optional<std::pair<double, double>> window;  // enable='between(t,a,b)'
    int time_decimals = 3;
};

// Geometric primitives the compiler asks for. It never learns which implementation it got.
class FilterVariants {
public:
    virtual ~FilterVariants() = default;

    virtual const char* name() const = 0;
    virtual graph::Label scale(graph::FilterGraph& g, graph::Label in, const Canvas& size, const ScaleOptions& opts) const = 0;
    virtual graph::Label overlay(graph::FilterGraph& g, graph::Label base, graph::Label top, const OverlayPlacement& at) const = 0;
    // Crop is CPU for every variant.
    virtual graph::Label crop(graph::FilterGraph& g, graph::Label in, const CropRect& rect) const;
};

class CpuFilters : public FilterVariants {
public:
    const char* name() const override { return "cpu"; }
    graph::Label scale(graph::FilterGraph& g, graph::Label in, const Canvas& size, const ScaleOptions& opts) const override;
    graph::Label overlay(graph::FilterGraph& g, graph::Label base, graph::Label top, const OverlayPlacement& at) const override;
};

// Uploads, runs the CUDA filter, downloads. Each primitive is self-contained so it can sit
// next to CPU-only stages.
class CudaFilters : public FilterVariants {
public:
    const char* name() const override { return "cuda"; }
    graph::Label scale(graph::FilterGraph& g, graph::Label in, const Canvas& size, const ScaleOptions& opts) const override;
    graph::Label overlay(graph::FilterGraph& g, graph::Label base, graph::Label top, const OverlayPlacement& at) const override;
};

std::unique_ptr<FilterVariants> make_filter_variants(FilterVariant variant);

// Filter text helpers shared by both variants.
std::string pad_filter(const Canvas& size, const std::string& color);
std::string enable_expression(double start, double end, int decimals);

} // namespace tlc::hw
