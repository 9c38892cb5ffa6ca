#include <algorithm>
#include <iostream>
#include <cstddef>
#include <vector>
#include <torch/torch.h>
#include <utility>
#include "../include/Polyview.h"

// Two synthetic views driven by a shared 2-d signal plus one private factor each.
static std::vector<torch::Tensor> make_views(int64_t n) {
    const auto shared = torch::randn({n, 2});
    const auto private_a = torch::randn({n, 1});
    const auto private_b = torch::randn({n, 1});
    auto view_a = torch::cat({shared, private_a}, 1).matmul(torch::randn({3, 10})) + 0.05 * torch::randn({n, 10});
    auto view_b = torch::cat({shared, private_b}, 1).matmul(torch::randn({3, 15})) + 0.05 * torch::randn({n, 15});
    return {std::move(view_a), std::move(view_b)};
}

int main() {
    torch::manual_seed(0);
    const int64_t N = 2048;
    const int64_t B = 128;
    const int64_t epochs = 30;

    const auto views = make_views(N);

    Polyview::ModelOptions options{
        .input_dims = {10, 15},
        .z_dim = 4,
        .hidden_layer_dims = {32},
        .non_linear = true,
        .activation = Polyview::Activation::GeLU,
        .learning_rate = 2e-3,
        .beta = 1.0,
        .threshold = 0.2,
        .join_type = Polyview::Fusion::JoinType::PoE,
        .logging = {.monitor = true},
    };
    Polyview::Config::apply_overrides(options, {{"hidden_layer_dims", std::vector<std::int64_t>{32, 16}}});

    auto model = Polyview::Model::make("joint_VAE", options);
    auto optimizers = model->configure_optimizers();

    for (int64_t epoch = 1; epoch <= epochs; ++epoch) {
        const auto permutation = torch::randperm(N);
        Polyview::Loss::Terms last{};
        for (int64_t start = 0; start < N; start += B) {
            const auto index = permutation.narrow(0, start, std::min(B, N - start));
            last = Polyview::Training::step(*model, optimizers, {views[0].index_select(0, index), views[1].index_select(0, index)});
        }
        if (epoch % 5 == 0) {
            Polyview::Training::print_step(std::cout, {.index = static_cast<std::size_t>(epoch)}, last);
        }
    }

    std::cout << "dropout rate: " << model->dropout() << std::endl;
    const auto latents = model->predict_latents(views);
    const auto kept = (latents.front().abs().sum(0) > 0).sum().item<int64_t>();
    std::cout << "kept latent dimensions: " << kept << "/" << model->z_dim() << std::endl;

    const auto reconstructions = model->predict_reconstructions(views);
    for (std::size_t view = 0; view < reconstructions.size(); ++view) {
        const auto error = Polyview::Loss::reconstruction_error(views[view], reconstructions[view].front());
        std::cout << "view " << view << " reconstruction error: " << error.item<double>() << std::endl;
    }
    return 0;
}
