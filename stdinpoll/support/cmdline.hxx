// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__CMDLINE__HXX
#define SUPPORT__CMDLINE__HXX

#include "stdinpoll/support/debug.hxx"
#include "stdinpoll/support/conv.hxx"
#include "stdinpoll/support/exception.hxx"

#include <string>
#include <vector>
#include <map>
#include <cstdlib>
#include <memory>

// Option, value

class CmdLine {
public:
    class Handler {
    public:
        virtual bool isNegatable() const = 0;
        virtual bool wantsValue() const = 0;
        virtual void handle(bool negated, const std::string & value) = 0;

        virtual ~Handler() {}
    };

private:
    struct Option {
        Option(std::unique_ptr<Handler> handler_,
               char                     shortOpt_,
               const std::string      & longOpt_) :
            handler(std::move(handler_)),
            shortOpt(shortOpt_),
            longOpt(longOpt_)
        {}

        std::unique_ptr<Handler> handler;
        char                     shortOpt;
        std::string              longOpt;
    };

    std::string                      _help;
    std::string                      _version;
    std::string                      _delimiter;

    std::vector<Option>              _options;

    std::map<char,        Handler *> _shortToHandler;
    std::map<std::string, Handler *> _longToHandler;

public:
    CmdLine(const std::string & help,
            const std::string & version,
            const std::string & delimiter = "--") :
        _help(help),
        _version(version),
        _delimiter(delimiter) {}

    void add(std::unique_ptr<Handler> handler,
             char shortOpt,
             const std::string & longOpt) {
        ENFORCE(!longOpt.empty() || shortOpt != '\0', << "Option needs a name.");

        if (!longOpt.empty()) {
            ENFORCE(_longToHandler.find(longOpt) == _longToHandler.end(),
                    << "Duplicate option: --" << longOpt);
            _longToHandler.insert(std::make_pair(longOpt, handler.get()));
        }

        if (shortOpt != '\0') {
            ENFORCE(_shortToHandler.find(shortOpt) == _shortToHandler.end(),
                    << "Duplicate option: -" << shortOpt);
            _shortToHandler.insert(std::make_pair(shortOpt, handler.get()));
        }

        _options.emplace_back(std::move(handler), shortOpt, longOpt);
    }

    std::vector<std::string> parse(int argc, const char ** argv) {
        std::vector<std::string> arguments;
        bool ignore = false;

        ASSERT(argc >= 1, );
        for (int i = 1; i != argc; ++i) {
            std::string str = argv[i];

            if (ignore || str.empty() || str.front() != '-' || str == "-") {
                arguments.push_back(str);
                continue;
            }

            if (str == "--help") {
                std::cerr << _help;
                std::exit(0);
            }

            if (str == "--version") {
                std::cerr << "stdinpoll version " << _version << std::endl;
                std::exit(0);
            }

            if (str == _delimiter) {
                ignore = true;
                continue;
            }

            if (str.substr(0, 2) == "--") {
                // Long option.
                size_t j = 2;
                bool negated = false;

                auto e = str.find('=', j);
                auto opt = str.substr(j, e == std::string::npos ? std::string::npos : e - j);
                auto handler = lookupLong(opt, negated);

                if (e == std::string::npos) {
                    // No value here
                    std::string value;
                    if (handler->wantsValue()) {
                        ++i;
                        THROW_UNLESS(i != argc, UserError("No value provided for: --" + opt));
                        value = argv[i];
                    }
                    handler->handle(negated, value);
                }
                else {
                    THROW_UNLESS(handler->wantsValue(),
                                 UserError("No value required for option: --" + opt));
                    handler->handle(negated, str.substr(e + 1));
                }
            }
            else {
                // Short options, possibly clustered. A short option that
                // takes a value consumes the rest of the word or the next
                // argument.
                for (size_t j = 1; j != str.size(); ++j) {
                    auto handler = lookupShort(str[j]);
                    if (handler->wantsValue()) {
                        std::string value = str.substr(j + 1);
                        if (value.empty()) {
                            ++i;
                            THROW_UNLESS(i != argc,
                                         UserError(std::string("No value provided for: -") + str[j]));
                            value = argv[i];
                        }
                        handler->handle(false, value);
                        break;
                    }
                    else {
                        handler->handle(false, "");
                    }
                }
            }
        }

        return arguments;
    }

protected:
    Handler * lookupShort(char s) {
        auto iter = _shortToHandler.find(s);

        if (iter == _shortToHandler.end()) {
            std::string str; str.push_back(s);
            THROW(UserError("Unknown option: -" + str));
        }

        return iter->second;
    }

    // Accepts --no-NAME for negatable options.
    Handler * lookupLong(const std::string & l, bool & negated) {
        auto iter = _longToHandler.find(l);

        if (iter != _longToHandler.end()) {
            negated = false;
            return iter->second;
        }

        if (l.substr(0, 3) == "no-") {
            iter = _longToHandler.find(l.substr(3));
            if (iter != _longToHandler.end() && iter->second->isNegatable()) {
                negated = true;
                return iter->second;
            }
        }

        THROW(UserError("Unknown option: --" + l));
    }
};

//
//
//

class BoolHandler final : public CmdLine::Handler {
    bool & _value;
public:
    explicit BoolHandler(bool & value) : _value(value) {}

    bool isNegatable() const override { return true; }
    bool wantsValue()  const override { return false; }

    void handle(bool negated, const std::string & UNUSED(value)) override {
        _value = !negated;
    }
};

template <class V>
class IStreamHandler final : public CmdLine::Handler {
    V & _value;
public:
    explicit IStreamHandler(V & value) : _value(value) {}

    bool isNegatable() const override { return false; }
    bool wantsValue()  const override { return true; }

    void handle(bool UNUSED(negated), const std::string & value) override {
        try {
            _value = unstringify<V>(value);
        }
        catch (const ConversionError &) {
            THROW(UserError("Bad option value: '" + value + "'"));
        }
    }
};

using StringHandler = IStreamHandler<std::string>;

#endif // SUPPORT__CMDLINE__HXX
