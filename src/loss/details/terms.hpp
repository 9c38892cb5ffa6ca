#ifndef POLYVIEW_LOSS_TERMS_HPP
#define POLYVIEW_LOSS_TERMS_HPP

#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Polyview::Loss::Details {

    // kl is reported unweighted; total already carries beta.
    struct Terms {
        torch::Tensor total{};
        torch::Tensor kl{};
        torch::Tensor ll{};

        [[nodiscard]] std::map<std::string, torch::Tensor> as_map() const {
            return {{"total", total}, {"kl", kl}, {"ll", ll}};
        }
    };

    // total = beta * kl - ll
    [[nodiscard]] inline Terms assemble(torch::Tensor kl, torch::Tensor ll, double beta) {
        if (!kl.defined() || !ll.defined()) {
            throw std::invalid_argument("Loss assembly requires defined kl and ll terms.");
        }
        if (beta < 0.0) {
            std::ostringstream message;
            message << "beta must be non-negative, got " << beta << '.';
            throw std::invalid_argument(message.str());
        }
        Terms terms{};
        terms.total = beta * kl - ll;
        terms.kl = std::move(kl);
        terms.ll = std::move(ll);
        return terms;
    }
}

#endif // POLYVIEW_LOSS_TERMS_HPP
