#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/// Scalar option values keyed by long flag name (e.g. `--sort`).
using ConfigOptions = std::map<std::string, std::string>;
/// Sequence option values keyed by long flag name (e.g. `--base-entries`).
using ConfigLists = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Turn a configuration key into its long flag name.
 *
 * camelCase keys are converted to kebab-case, so both `sortWhenCleaning` and
 * `sort-when-cleaning` yield `--sort-when-cleaning`.
 */
std::string config_key_to_flag(const std::string& key);

/**
 * @brief Load configuration options from a YAML file.
 *
 * Scalars are stored in @p opts and sequences of scalars in @p list_opts.
 * Nested maps are treated as categories and flattened, so
 * `cleaning: {sort: true}` is the same as `sort: true`. A null value is
 * stored as an empty string.
 *
 * @param path      Filesystem path to the YAML configuration file.
 * @param opts      Map receiving scalar option values.
 * @param list_opts Map receiving list option values.
 * @param error     Output string capturing a human-readable error message on
 *                  failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, ConfigOptions& opts, ConfigLists& list_opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as load_yaml_config(): objects are flattened, arrays
 * become list values and `null` becomes an empty string.
 *
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise, with @p error describing the problem.
 */
bool load_json_config(const std::string& path, ConfigOptions& opts, ConfigLists& list_opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
