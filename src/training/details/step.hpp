#ifndef POLYVIEW_TRAINING_STEP_HPP
#define POLYVIEW_TRAINING_STEP_HPP

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../../loss/loss.hpp"
#include "../../model/model.hpp"
#include "../../utils/terminal.hpp"

namespace Polyview::Training::Details {

    struct StepOptions {
        bool monitor{false};
        std::ostream* stream{&std::cout};
        std::optional<std::size_t> index{}; // printed as "Step [index]" when set
    };

    inline void print_step(std::ostream& stream, const StepOptions& options, const Loss::Terms& terms)
    {
        using Utils::Terminal::ApplyColor;
        using Utils::Terminal::Colors::kBrightBlue;
        using Utils::Terminal::Colors::kBrightYellow;

        std::ostringstream line;
        if (options.index) {
            line << "Step [" << *options.index << "] | ";
        }
        line << ApplyColor("total", kBrightYellow) << ": "
             << std::fixed << std::setprecision(6) << terms.total.item<double>() << " | ";
        line << ApplyColor("kl", kBrightBlue) << ": " << terms.kl.item<double>() << " | ";
        line << ApplyColor("ll", kBrightBlue) << ": " << terms.ll.item<double>();
        stream << line.str() << '\n';
    }

    // One optimisation step: zero grads, forward, loss, backward on total, step every optimizer.
    inline Loss::Terms step(Model::Base& model,
                            std::vector<std::unique_ptr<torch::optim::Optimizer>>& optimizers,
                            const Model::Views& views,
                            const StepOptions& options = {})
    {
        if (optimizers.empty()) {
            throw std::invalid_argument("Training step requires at least one optimizer.");
        }
        if (options.monitor && options.stream == nullptr) {
            throw std::invalid_argument("Monitoring requires a non-null output stream.");
        }

        model.train();
        for (auto& optimizer : optimizers) {
            optimizer->zero_grad();
        }

        const auto output = model.forward(views);
        auto terms = model.loss_function(views, output);
        terms.total.backward();

        for (auto& optimizer : optimizers) {
            optimizer->step();
        }

        Loss::Terms detached{terms.total.detach(), terms.kl.detach(), terms.ll.detach()};
        if (options.monitor) {
            print_step(*options.stream, options, detached);
        }
        return detached;
    }
}

#endif // POLYVIEW_TRAINING_STEP_HPP
