#pragma once 
#include <stdexcept>
#include <string>

namespace cancor_core {
namespace util {

class cancor_core_error: public std::exception 
{
    std::string _msg;

public:
    cancor_core_error(
        const std::string& msg
    ):
        _msg("cancor_core: " + msg)
    {}

    cancor_core_error(
        const std::string& prefix,
        const std::string& msg
    ):
        _msg("cancor_core " + prefix + ": " + msg)
    {}

    const char* what() const noexcept override {
        return _msg.data();
    }
};

class cancor_core_config_error: public cancor_core_error
{
public:
    cancor_core_config_error(
        const std::string& msg
    ):
        cancor_core_error("config", msg)
    {}
};

class cancor_core_degenerate_error: public cancor_core_error
{
    int _view_idx;

public:
    cancor_core_degenerate_error(int view_idx):
        cancor_core_error(
            "degenerate", 
            "all result weights are zero or non-finite in view " + std::to_string(view_idx) + 
            ". Try less regularisation or another initialisation."
        ),
        _view_idx(view_idx)
    {}

    int view_idx() const { return _view_idx; }
};

class cancor_core_solver_error: public cancor_core_error
{
public:
    cancor_core_solver_error(
        const std::string& msg
    ):
        cancor_core_error("solver", msg)
    {}
};

class max_iters_error : public cancor_core_solver_error
{
public:
    max_iters_error(const std::string& name)
        : cancor_core_solver_error(name + ": max iterations reached!")
    {}
};

} // namespace util
} // namespace cancor_core
