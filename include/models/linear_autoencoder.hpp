#pragma once

#include "models/imodel.hpp"

#include <Eigen/Dense>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace auditfusion {

/**
 * @brief Linear autoencoder fitted in closed form (principal components).
 *
 * Encoder projects the centered input onto the top latent_dim eigenvectors of
 * the sample covariance; the decoder is the transpose. Reconstruction error
 * is the mean squared error over the input dimensions.
 */
class LinearAutoencoder : public IModel {
public:
    struct Params {
        size_t latent_dim = 0;         // 0: max(1, input_dim / 4)
        double contamination = 0.1;    // error cutoff at 100*(1-c) percentile
    };

    /**
     * @brief Fit on row-major samples. Returns nullptr if stop was requested.
     * @throws std::invalid_argument on empty or ragged input
     */
    [[nodiscard]] static std::shared_ptr<LinearAutoencoder> fit(
        const std::vector<std::vector<double>>& rows,
        std::vector<std::string> feature_names,
        const Params& params,
        std::stop_token stop = {});

    [[nodiscard]] std::vector<double> reconstruct(const std::vector<double>& x) const;
    [[nodiscard]] double reconstruction_error(const std::vector<double>& x) const;

    /// Error at the fitted contamination percentile of the training rows
    [[nodiscard]] double threshold() const { return threshold_; }
    [[nodiscard]] size_t latent_dim() const { return static_cast<size_t>(components_.cols()); }

    [[nodiscard]] std::string_view kind() const override { return "linear_autoencoder"; }
    [[nodiscard]] const std::vector<std::string>& feature_names() const override {
        return feature_names_;
    }

private:
    LinearAutoencoder() = default;

    [[nodiscard]] Eigen::VectorXd reconstruct_vec(const Eigen::VectorXd& x) const;

    Eigen::VectorXd mean_;
    Eigen::MatrixXd components_;   // input_dim x latent_dim, orthonormal columns
    std::vector<std::string> feature_names_;
    double threshold_ = 0.0;
};

} // namespace auditfusion
