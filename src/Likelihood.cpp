#include "starfit/Likelihood.hpp"
#include "starfit/JsonUtils.hpp"
#include <Eigen/Eigenvalues>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace starfit {

std::string CovarianceDiagnostics::describe() const
{
    std::ostringstream os;
    os << "N=" << size
       << " diag=[" << min_diagonal << ", " << max_diagonal << "]"
       << " max|offdiag|=" << max_offdiagonal
       << " min eigenvalue=" << min_eigenvalue;
    if (!symmetric)         os << " NOT symmetric";
    if (!dump_path.empty()) os << " dumped to " << dump_path;
    return os.str();
}

Matrix design_matrix(const Vector& k, const ComponentModel& c)
{
    return (k.array() * c.flux_std.array()).matrix().asDiagonal()
           * c.eigenspectra.transpose();
}

Vector component_mean(const Vector& k, const ComponentModel& c)
{
    return k.cwiseProduct(c.flux_mean) - design_matrix(k, c) * c.emu->mus;
}

double log_det_cholesky(const Eigen::LLT<Matrix>& llt)
{
    return 2.0 * llt.matrixLLT().diagonal().array().log().sum();
}

CovarianceDiagnostics diagnose_covariance(const Matrix& CC)
{
    CovarianceDiagnostics d;
    d.size = static_cast<long>(CC.rows());
    if (CC.size() == 0) return d;

    d.min_diagonal = CC.diagonal().minCoeff();
    d.max_diagonal = CC.diagonal().maxCoeff();

    Matrix off = CC;
    off.diagonal().setZero();
    d.max_offdiagonal = off.cwiseAbs().maxCoeff();
    d.symmetric       = CC.isApprox(CC.transpose());

    if (CC.allFinite()) {
        Eigen::SelfAdjointEigenSolver<Matrix> es(CC, Eigen::EigenvaluesOnly);
        d.min_eigenvalue = es.eigenvalues().minCoeff();
    } else {
        d.min_eigenvalue = std::numeric_limits<double>::quiet_NaN();
    }
    return d;
}

/* --------------------------------------------------------------------- */
/*  write CC and the parameters next to each other for offline digging   */
/* --------------------------------------------------------------------- */
static std::string write_dump(const FailureDump& dump, const Matrix& CC,
                              const CovarianceDiagnostics& diag)
{
    fs::create_directories(dump.directory);
    const fs::path base = fs::path(dump.directory) / dump.tag;

    const std::string cc_path = base.string() + "_CC.txt";
    {
        std::ofstream out(cc_path);
        if (!out) throw std::runtime_error("Cannot write '" + cc_path + "'");
        const Eigen::IOFormat full(Eigen::FullPrecision, Eigen::DontAlignCols, " ", "\n");
        out << CC.format(full) << '\n';
    }

    nlohmann::json j = dump.context ? dump.context() : nlohmann::json::object();
    j["diagnostics"] = { {"size",            diag.size},
                         {"min_diagonal",    diag.min_diagonal},
                         {"max_diagonal",    diag.max_diagonal},
                         {"max_offdiagonal", diag.max_offdiagonal},
                         {"min_eigenvalue",  diag.min_eigenvalue},
                         {"symmetric",       diag.symmetric} };
    save_json(j, base.string() + "_context.json");
    return cc_path;
}

[[noreturn]] static void fail(const std::string& what, const Matrix& CC,
                              const FailureDump* dump)
{
    CovarianceDiagnostics diag = diagnose_covariance(CC);
    if (dump && !dump->directory.empty())
        diag.dump_path = write_dump(*dump, CC, diag);

    std::cerr << "[Likelihood] " << what << ": " << diag.describe() << '\n';
    throw CholeskyError(what, std::move(diag));
}

/* ===================================================================== */
LikelihoodResult evaluate_lnprob(const Vector&        fl,
                                 const Vector&        k,
                                 const ComponentPair& comps,
                                 const Matrix&        data_mat,
                                 const FailureDump*   dump)
{
    const Eigen::Index N = fl.size();
    if (k.size() != N || data_mat.rows() != N || data_mat.cols() != N)
        throw std::invalid_argument("evaluate_lnprob: array sizes do not match the data");
    for (const auto& c : comps)
        if (!c.emu || c.flux_mean.size() != N || c.eigenspectra.cols() != N ||
            c.eigenspectra.rows() != c.emu->mus.size())
            throw std::invalid_argument("evaluate_lnprob: component not on the data grid");

    /* ---- covariance: projected emulator uncertainty + data ---------- */
    Matrix CC = data_mat;
    Vector model = Vector::Zero(N);
    for (const auto& c : comps) {
        const Matrix X = design_matrix(k, c);
        CC.noalias() += X * c.emu->C_GP * X.transpose();
        model += k.cwiseProduct(c.flux_mean) - X * c.emu->mus;
    }

    if (!CC.allFinite())
        fail("covariance matrix has non-finite entries", CC, dump);

    Eigen::LLT<Matrix> llt(CC);
    if (llt.info() != Eigen::Success)
        fail("covariance matrix is not positive definite", CC, dump);

    const Vector R = fl - model;

    LikelihoodResult res;
    res.chi2   = R.dot(llt.solve(R));
    res.logdet = log_det_cholesky(llt);
    res.lnprob = -0.5 * (res.chi2 + res.logdet);
    return res;
}

} // namespace starfit
