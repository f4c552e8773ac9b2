#pragma once
#include "Types.hpp"
#include "Errors.hpp"
#include "EmulatorCache.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <functional>
#include <string>

namespace starfit {

/* ------------------------------------------------------------------------- */
/*  One star, already broadened / shifted / resampled onto the data grid     */
/* ------------------------------------------------------------------------- */
struct ComponentModel {
    Vector            flux_mean;      // N, Omega applied
    Vector            flux_std;       // N, Omega applied
    Matrix            eigenspectra;   // M x N
    EmulatorMatrixPtr emu;            // mus (M), C_GP (M x M)
    double            Omega = 1.0;
};

using ComponentPair = std::array<ComponentModel, 2>;

struct LikelihoodResult {
    double lnprob = 0.0;
    double chi2   = 0.0;      // R^T CC^-1 R
    double logdet = 0.0;      // log |CC|
};

/* what to write when the covariance cannot be factorised */
struct FailureDump {
    std::string                     directory;   // empty -> nothing written
    std::string                     tag;         // file stem
    std::function<nlohmann::json()> context;     // parameters at the time
};

/* X = diag(k * flux_std) * eigenspectra^T                    (N x M) */
Matrix design_matrix(const Vector& k, const ComponentModel& c);

/* k * flux_mean - X * mus                                          */
Vector component_mean(const Vector& k, const ComponentModel& c);

/* log |A| from the Cholesky factor of A */
double log_det_cholesky(const Eigen::LLT<Matrix>& llt);

CovarianceDiagnostics diagnose_covariance(const Matrix& CC);

/*
 * Gaussian log-likelihood of fl given both components and the data
 * covariance.  Throws CholeskyError (after writing the dump, if asked)
 * when CC is not positive definite.
 */
LikelihoodResult evaluate_lnprob(const Vector&        fl,
                                 const Vector&        k,
                                 const ComponentPair& comps,
                                 const Matrix&        data_mat,
                                 const FailureDump*   dump = nullptr);

} // namespace starfit
