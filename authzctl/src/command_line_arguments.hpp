#pragma once

#include "errors/errors.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace authzctl {

    class CommandLine;

    using ArgIterator = std::vector<std::string>::const_iterator;

    class argument {
    protected:
        const std::string _option;
        const std::string _longOption;
        const std::string _description;

        [[nodiscard]] bool isMatch(const std::string &argString) const {
            std::string a = argString;
            std::transform(a.begin(), a.end(), a.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return a == _option || a == _longOption;
        }

        argument(
            const std::string_view option,
            const std::string_view longOption,
            const std::string_view description)
            : _option(std::string("-") + std::string(option)),
              _longOption(std::string("--") + std::string(longOption)), _description(description) {
        }

    public:
        virtual ~argument() = default;

        argument(argument &&) = delete;
        argument &operator=(const argument &rhs) = delete;
        argument(const argument &) = delete;
        argument &operator=(argument &&) = delete;

        [[nodiscard]] std::string getDescription() const {
            return _option + "\t" + _longOption + " : " + _description;
        }

        /**
         * Consume the option at i (and its value, if any). Returns false if the option is not
         * this argument.
         */
        virtual bool process(CommandLine &parent, ArgIterator &i, const ArgIterator &end) const = 0;
    };

    class argumentFlag : public argument {
        using handlerType = std::function<void(CommandLine &)>;
        handlerType _handler;

    public:
        template<typename... A>
        explicit argumentFlag(handlerType handler, A &&...a)
            : argument(std::forward<A>(a)...), _handler(std::move(handler)) {
        }

        bool process(CommandLine &parent, ArgIterator &i, const ArgIterator &) const override {
            if(isMatch(*i)) {
                _handler(parent);
                return true;
            }
            return false;
        }
    };

    template<class T>
    class argumentValue : public argument {
    protected:
        T _extractValue(const std::string &val) const;

        using handlerType = std::function<void(CommandLine &, T)>;
        handlerType _handler;

    public:
        template<typename... A>
        explicit argumentValue(handlerType handler, A &&...a)
            : argument(std::forward<A>(a)...), _handler(std::move(handler)) {
        }

        bool process(CommandLine &parent, ArgIterator &i, const ArgIterator &end) const override {
            if(!isMatch(*i)) {
                return false;
            }
            if(std::next(i) == end) {
                throw authz::errors::InvalidArgument("Missing a value for " + _longOption);
            }
            ++i;
            _handler(parent, _extractValue(*i));
            return true;
        }
    };

    template<>
    inline std::string argumentValue<std::string>::_extractValue(const std::string &val) const {
        if(val.empty()) {
            throw authz::errors::InvalidArgument("Missing a value for " + _longOption);
        }
        return val;
    }

    template<class V, class... T>
    std::unique_ptr<argument> makeEntry(T &&...t) {
        return std::unique_ptr<argument>(std::make_unique<V>(std::forward<T>(t)...));
    }

} // namespace authzctl
