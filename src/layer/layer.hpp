#ifndef POLYVIEW_LAYER_HPP
#define POLYVIEW_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/mlp.hpp"
#include "details/encoder.hpp"
#include "details/decoder.hpp"

namespace Polyview::Layer {
    using MLPOptions = Details::MLPOptions;
    using MLP = Details::MLP;

    using EncoderOptions = Details::EncoderOptions;
    using EncoderModule = Details::EncoderModule;
    using EncoderFactory = Details::EncoderFactory;
    using GateSlice = Details::GateSlice;

    using DecoderOptions = Details::DecoderOptions;
    using DecoderModule = Details::DecoderModule;
    using DecoderFactory = Details::DecoderFactory;

    [[nodiscard]] inline auto DefaultEncoder() -> EncoderFactory {
        return &Details::make_mlp_encoder;
    }

    [[nodiscard]] inline auto DefaultDecoder() -> DecoderFactory {
        return &Details::make_mlp_decoder;
    }
}

#endif //POLYVIEW_LAYER_HPP
