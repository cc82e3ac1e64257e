#include "hw/filter_variants.hpp"
#include "core/time.hpp"

namespace tlc::hw {

std::string pad_filter(const Canvas& size, const std::string& color) {
    return "pad=" + std::to_string(size.width) + ":" + std::to_string(size.height) +
           ":(ow-iw)/2:(oh-ih)/2:" + color;
}

std::string enable_expression(double start, double end, int decimals) {
    return "enable='between(t," + format_seconds(round_to(start, decimals), decimals) + "," +
           format_seconds(round_to(end, decimals), decimals) + ")'";
}

graph::Label FilterVariants::crop(graph::FilterGraph& g, graph::Label in, const CropRect& rect) const {
    return g.append(in, "crop=" + std::to_string(rect.width) + ":" + std::to_string(rect.height) + ":" +
                        std::to_string(rect.x) + ":" + std::to_string(rect.y) + ",setsar=1", "crop");
}

graph::Label CpuFilters::scale(graph::FilterGraph& g, graph::Label in, const Canvas& size, const ScaleOptions& opts) const {
    std::string chain = "scale=" + std::to_string(size.width) + ":" + std::to_string(size.height) +
                        ":force_original_aspect_ratio=decrease:flags=fast_bilinear";
    if (opts.pad && !opts.pad_format.empty()) chain += ",format=" + opts.pad_format;
    if (opts.pad) chain += "," + pad_filter(size, opts.pad_color);
    if (opts.reset_sar) chain += ",setsar=1";
    return g.append(in, std::move(chain), "scaled");
}

graph::Label CpuFilters::overlay(graph::FilterGraph& g, graph::Label base, graph::Label top, const OverlayPlacement& at) const {
    std::string chain = "overlay=" + at.x + ":" + at.y;
    if (at.window) chain += ":" + enable_expression(at.window->first, at.window->second, at.time_decimals);
    return g.add({base, top}, std::move(chain), "comp");
}

graph::Label CudaFilters::scale(graph::FilterGraph& g, graph::Label in, const Canvas& size, const ScaleOptions& opts) const {
    std::string chain = "hwupload_cuda,scale_cuda=" + std::to_string(size.width) + ":" + std::to_string(size.height) +
                        ":force_original_aspect_ratio=decrease,hwdownload,format=nv12";
    if (opts.pad && !opts.pad_format.empty()) chain += ",format=" + opts.pad_format;
    if (opts.pad) chain += "," + pad_filter(size, opts.pad_color);
    if (opts.reset_sar) chain += ",setsar=1";
    return g.append(in, std::move(chain), "scaled");
}

graph::Label CudaFilters::overlay(graph::FilterGraph& g, graph::Label base, graph::Label top, const OverlayPlacement& at) const {
    graph::Label base_gpu = g.append(base, "hwupload_cuda", "base_gpu");
    graph::Label top_gpu = g.append(top, "format=yuva420p,hwupload_cuda", "top_gpu");
    std::string chain = "overlay_cuda=" + at.x + ":" + at.y;
    if (at.window) chain += ":" + enable_expression(at.window->first, at.window->second, at.time_decimals);
    chain += ",hwdownload,format=nv12";
    return g.add({base_gpu, top_gpu}, std::move(chain), "comp");
}

std::unique_ptr<FilterVariants> make_filter_variants(FilterVariant variant) {
    if (variant == FilterVariant::Cuda) return std::make_unique<CudaFilters>();
    return std::make_unique<CpuFilters>();
}

} // namespace tlc::hw
