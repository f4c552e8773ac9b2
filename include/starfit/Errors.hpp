#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace starfit {

/* ------------------------------------------------------------------ *
 *  A proposal that cannot be turned into a model spectrum.           *
 *  Caught at the OrderModel boundary and mapped to lnprob = -inf.    *
 * ------------------------------------------------------------------ */
class ModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* emulator query outside the trained grid hull */
class OutOfGridError : public ModelError {
public:
    using ModelError::ModelError;
};

/* data wavelengths not covered by the (shifted) high-resolution grid */
class GridRangeError : public ModelError {
public:
    using ModelError::ModelError;
};

/* summary of a matrix that failed to factorise */
struct CovarianceDiagnostics {
    long   size            = 0;
    double min_diagonal    = 0.0;
    double max_diagonal    = 0.0;
    double max_offdiagonal = 0.0;    // largest |C_ij|, i != j
    double min_eigenvalue  = 0.0;
    bool   symmetric       = true;
    std::string dump_path;           // empty if nothing was written

    std::string describe() const;
};

/* ------------------------------------------------------------------ *
 *  Covariance matrix not positive definite.  Fatal for the run.      *
 * ------------------------------------------------------------------ */
class CholeskyError : public std::runtime_error {
public:
    CholeskyError(const std::string& what, CovarianceDiagnostics diag)
        : std::runtime_error(what + " (" + diag.describe() + ")")
        , diag_(std::move(diag)) {}

    const CovarianceDiagnostics& diagnostics() const { return diag_; }

private:
    CovarianceDiagnostics diag_;
};

} // namespace starfit
