#include "models/linear_autoencoder.hpp"
#include "core/stats.hpp"

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <stdexcept>

namespace auditfusion {

std::shared_ptr<LinearAutoencoder> LinearAutoencoder::fit(
    const std::vector<std::vector<double>>& rows,
    std::vector<std::string> feature_names,
    const Params& params,
    std::stop_token stop) {

    if (rows.empty()) {
        throw std::invalid_argument("LinearAutoencoder: no training data");
    }
    const auto n = static_cast<Eigen::Index>(rows.size());
    const auto d = static_cast<Eigen::Index>(rows.front().size());
    if (d == 0) {
        throw std::invalid_argument("LinearAutoencoder: zero-width input");
    }

    Eigen::MatrixXd X(n, d);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& r = rows[static_cast<size_t>(i)];
        if (static_cast<Eigen::Index>(r.size()) != d) {
            throw std::invalid_argument("LinearAutoencoder: inconsistent feature size");
        }
        for (Eigen::Index j = 0; j < d; ++j) X(i, j) = r[static_cast<size_t>(j)];
    }

    std::shared_ptr<LinearAutoencoder> model(new LinearAutoencoder());
    model->feature_names_ = std::move(feature_names);
    model->mean_ = X.colwise().mean().transpose();

    const Eigen::MatrixXd centered = X.rowwise() - model->mean_.transpose();
    const double denom = n > 1 ? static_cast<double>(n - 1) : 1.0;
    const Eigen::MatrixXd cov = (centered.transpose() * centered) / denom;

    if (stop.stop_requested()) return nullptr;

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("LinearAutoencoder: eigen decomposition failed");
    }

    Eigen::Index k = params.latent_dim > 0
        ? static_cast<Eigen::Index>(params.latent_dim)
        : std::max<Eigen::Index>(1, d / 4);
    k = std::min(k, d);

    // Eigenvalues come back ascending; keep the trailing k columns
    model->components_ = solver.eigenvectors().rightCols(k);

    if (stop.stop_requested()) return nullptr;

    std::vector<double> errors;
    errors.reserve(rows.size());
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::VectorXd x = X.row(i).transpose();
        errors.push_back((x - model->reconstruct_vec(x)).squaredNorm() / static_cast<double>(d));
    }
    model->threshold_ = stats::quantile(std::move(errors),
                                        1.0 - std::clamp(params.contamination, 0.0, 1.0));
    return model;
}

Eigen::VectorXd LinearAutoencoder::reconstruct_vec(const Eigen::VectorXd& x) const {
    const Eigen::VectorXd latent = components_.transpose() * (x - mean_);
    return mean_ + components_ * latent;
}

std::vector<double> LinearAutoencoder::reconstruct(const std::vector<double>& x) const {
    if (static_cast<Eigen::Index>(x.size()) != mean_.size()) {
        throw std::invalid_argument("LinearAutoencoder: input size mismatch");
    }
    const Eigen::VectorXd v = Eigen::Map<const Eigen::VectorXd>(x.data(), mean_.size());
    const Eigen::VectorXd out = reconstruct_vec(v);
    return {out.data(), out.data() + out.size()};
}

double LinearAutoencoder::reconstruction_error(const std::vector<double>& x) const {
    if (static_cast<Eigen::Index>(x.size()) != mean_.size()) {
        throw std::invalid_argument("LinearAutoencoder: input size mismatch");
    }
    const Eigen::VectorXd v = Eigen::Map<const Eigen::VectorXd>(x.data(), mean_.size());
    return (v - reconstruct_vec(v)).squaredNorm() / static_cast<double>(mean_.size());
}

} // namespace auditfusion
