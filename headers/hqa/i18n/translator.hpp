#ifndef HQA_TRANSLATOR_HPP
#define HQA_TRANSLATOR_HPP

/**
 * @file translator.hpp
 * @brief Message catalog lookup with {{param}} interpolation.
 *
 * Every user-facing string the engine produces goes through
 * Translator::translate(). A translator that was never initialized, or a
 * key missing from the catalog, yields the key itself so that analysis
 * keeps working without any catalog at all.
 *
 * Catalog files are JSON. Nested objects are flattened to dotted keys:
 * @code
 *     { "findings": { "no_var": { "message": "..." } } }
 *     // -> "findings.no_var.message"
 * @endcode
 */

#include "hqa/result.hpp"
#include "hqa/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hqa::i18n {

    namespace fs = std::filesystem;

    using Params = std::vector<std::pair<std::string, std::string>>;

    class Translator {
    public:
        /**
         * Installs the built-in English catalog. Entries loaded earlier
         * from files take precedence over built-in ones.
         */
        void initialize();

        [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

        /**
         * Merges a JSON catalog file into the current catalog.
         */
        [[nodiscard]] Result<void, Error> load_catalog(const fs::path& path);

        /**
         * Merges a JSON catalog given as text.
         */
        [[nodiscard]] Result<void, Error> load_catalog_string(std::string_view json_text);

        /**
         * Looks up key and substitutes each {{name}} from params.
         * Unknown placeholders are left as they are.
         */
        [[nodiscard]] std::string translate(std::string_view key, const Params& params = {}) const;

        [[nodiscard]] std::size_t size() const noexcept { return messages_.size(); }

    private:
        std::unordered_map<std::string, std::string> messages_;
        bool initialized_ = false;
    };

}  // namespace hqa::i18n

#endif // HQA_TRANSLATOR_HPP
