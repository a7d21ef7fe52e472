#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace service {

struct TomographyConfig;

class Validator {
public:
    virtual ~Validator() = default;
    virtual void validate(const TomographyConfig& config) const = 0;
    virtual std::string name() const;
};

class LambdaValidator final : public Validator {
public:
    using ValidateFn = std::function<void(const TomographyConfig& config)>;

    LambdaValidator(std::string name, ValidateFn fn);
    void validate(const TomographyConfig& config) const override;
    std::string name() const override;

private:
    std::string name_;
    ValidateFn fn_;
};

class ValidatorRegistry final {
public:
    void register_validator(std::unique_ptr<Validator> validator);
    // Runs validators in registration order; the first failure is rethrown
    // as std::invalid_argument prefixed with the validator name.
    void run_all_validators(const TomographyConfig& config) const;
    std::vector<std::string> validator_names() const;

private:
    std::vector<std::unique_ptr<Validator>> validators_;
};

std::unique_ptr<Validator> make_qubit_count_validator();
std::unique_ptr<Validator> make_shot_budget_validator();
std::unique_ptr<Validator> make_supplied_angles_validator();
std::unique_ptr<Validator> make_multi_start_validator();

ValidatorRegistry make_default_validator_registry();

// Fails fast on an unusable configuration. Angle-length problems surface as
// DimensionMismatch; everything else as std::invalid_argument.
void validate_config(const TomographyConfig& config);

}  // namespace service
