#include "config/config_loader.hpp"

#include "common/logger.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pmm {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw std::invalid_argument("invalid config: " + message);
}

// Minimal JSON value. Numbers keep their source text so decimal options load exactly.
struct JsonValue {
    enum Type { Null, Bool, Number, String, Array, Object };
    Type type = Null;
    bool boolean = false;
    std::string text;   // number token or string contents
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    const JsonValue* find(const std::string& key) const {
        for (const auto& [k, v] : obj) {
            if (k == key) return &v;
        }
        return nullptr;
    }
};

// Recursive descent JSON parser. Throws on malformed input.
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    JsonValue parse() {
        skip_ws();
        JsonValue v = parse_value();
        skip_ws();
        if (pos_ != input_.size()) error("trailing characters");
        return v;
    }

private:
    const std::string& input_;
    size_t pos_;

    [[noreturn]] void error(const std::string& what) const {
        fail("malformed JSON at offset " + std::to_string(pos_) + ": " + what);
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() { return pos_ < input_.size() ? input_[pos_++] : '\0'; }
    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }
    void expect(char c) {
        if (next() != c) error(std::string("expected '") + c + "'");
    }
    void literal(const char* word) {
        for (const char* p = word; *p; ++p) {
            if (next() != *p) error(std::string("expected '") + word + "'");
        }
    }

    JsonValue parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') return parse_string();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == 'n') { literal("null"); return JsonValue{}; }
        if (c == 't') { literal("true"); JsonValue v; v.type = JsonValue::Bool; v.boolean = true; return v; }
        if (c == 'f') { literal("false"); JsonValue v; v.type = JsonValue::Bool; return v; }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        error("unexpected character");
    }

    JsonValue parse_string() {
        expect('"');
        JsonValue v;
        v.type = JsonValue::String;
        while (peek() != '"') {
            if (peek() == '\0') error("unterminated string");
            if (peek() == '\\') {
                next();
                char e = next();
                switch (e) {
                    case 'n': v.text += '\n'; break;
                    case 't': v.text += '\t'; break;
                    case 'r': v.text += '\r'; break;
                    case '"': case '\\': case '/': v.text += e; break;
                    default: error("unsupported escape");
                }
            } else {
                v.text += next();
            }
        }
        next(); // closing "
        return v;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        auto digits = [this] {
            size_t n = 0;
            while (std::isdigit(static_cast<unsigned char>(peek()))) { next(); ++n; }
            return n;
        };
        if (peek() == '-') next();
        if (digits() == 0) error("expected digits");
        if (peek() == '.') {
            next();
            if (digits() == 0) error("expected fraction digits");
        }
        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            if (digits() == 0) error("expected exponent digits");
        }
        JsonValue v;
        v.type = JsonValue::Number;
        v.text = input_.substr(start, pos_ - start);
        return v;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue v;
        v.type = JsonValue::Array;
        skip_ws();
        if (peek() == ']') { next(); return v; }
        while (true) {
            v.arr.push_back(parse_value());
            skip_ws();
            if (peek() == ',') { next(); continue; }
            expect(']');
            return v;
        }
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue v;
        v.type = JsonValue::Object;
        skip_ws();
        if (peek() == '}') { next(); return v; }
        while (true) {
            skip_ws();
            auto key = parse_string();
            skip_ws();
            expect(':');
            auto val = parse_value();
            v.obj.emplace_back(key.text, std::move(val));
            skip_ws();
            if (peek() == ',') { next(); continue; }
            expect('}');
            return v;
        }
    }
};

// Typed readers: leave `out` untouched when the key is absent
class Section {
public:
    Section(const JsonValue& node, std::string prefix)
        : node_(node), prefix_(std::move(prefix)) {}

    void read(const std::string& key, std::string& out) const {
        if (const auto* v = lookup(key, JsonValue::String, "a string")) out = v->text;
    }

    void read(const std::string& key, Decimal& out) const {
        if (const auto* v = lookup(key, JsonValue::Number, "a number")) {
            auto d = Decimal::parse(v->text);
            if (!d) fail(name(key) + " is out of range");
            out = *d;
        }
    }

    void read(const std::string& key, double& out) const {
        if (const auto* v = lookup(key, JsonValue::Number, "a number")) {
            try {
                out = std::stod(v->text);
            } catch (const std::out_of_range&) {
                fail(name(key) + " is out of range");
            }
        }
    }

    template <typename Int>
    void read_int(const std::string& key, Int& out) const {
        const auto* v = lookup(key, JsonValue::Number, "an integer");
        if (!v) return;
        long long parsed = 0;
        const char* first = v->text.data();
        const char* last = first + v->text.size();
        auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec != std::errc{} || ptr != last) fail(name(key) + " must be an integer");
        bool in_range = parsed < 0
            ? parsed >= static_cast<long long>(std::numeric_limits<Int>::min())
            : static_cast<unsigned long long>(parsed) <=
                  static_cast<unsigned long long>(std::numeric_limits<Int>::max());
        if (!in_range) {
            fail(name(key) + " is out of range");
        }
        out = static_cast<Int>(parsed);
    }

    const JsonValue* object(const std::string& key) const {
        return lookup(key, JsonValue::Object, "an object");
    }

private:
    std::string name(const std::string& key) const { return prefix_ + key; }

    const JsonValue* lookup(const std::string& key, JsonValue::Type type,
                            const char* expected) const {
        const JsonValue* v = node_.find(key);
        if (!v || v->type == JsonValue::Null) return nullptr;
        if (v->type != type) fail(name(key) + " must be " + expected);
        return v;
    }

    const JsonValue& node_;
    std::string      prefix_;
};

void read_strategy(const Section& root, StrategyConfig& s) {
    root.read("trading_pair", s.trading_pair);
    root.read("exchange", s.exchange);
    root.read("order_amount", s.order_amount);
    root.read_int("order_refresh_time", s.order_refresh_time_s);

    if (const auto* c = root.object("candles")) {
        Section candles(*c, "candles.");
        candles.read("connector", s.candles.connector);
        candles.read("interval", s.candles.interval);
        candles.read_int("max_records", s.candles.max_records);
    }

    root.read_int("natr_length", s.natr_length);
    root.read_int("macd_fast", s.macd_fast);
    root.read_int("macd_slow", s.macd_slow);
    root.read_int("macd_signal", s.macd_signal);

    root.read("bid_natr_scalar", s.bid_natr_scalar);
    root.read("ask_natr_scalar", s.ask_natr_scalar);
    root.read("macd_weight", s.macd_weight);
    root.read("inventory_phi", s.inventory_phi);
    root.read("max_inventory", s.max_inventory);
    root.read("min_spread", s.min_spread);
}

void read_paper(const Section& paper, PaperTradeConfig& p) {
    paper.read("initial_base", p.initial_base);
    paper.read("initial_quote", p.initial_quote);
    paper.read("start_price", p.start_price);
    paper.read("volatility", p.volatility);
    paper.read("book_spread_bps", p.book_spread_bps);
    paper.read_int("book_depth", p.book_depth);
    paper.read_int("tick_interval_ms", p.tick_interval_ms);
    paper.read_int("seed", p.seed);
    paper.read_int("price_decimals", p.price_decimals);
    paper.read("data_file", p.data_file);
}

} // anonymous namespace

AppConfig parse_config(const std::string& text) {
    JsonParser parser(text);
    auto root = parser.parse();
    if (root.type != JsonValue::Object) fail("top level must be an object");

    AppConfig config;
    Section top(root, "");
    read_strategy(top, config.strategy);
    if (const auto* p = top.object("paper")) {
        read_paper(Section(*p, "paper."), config.paper);
    }

    config.strategy.validate();
    config.paper.validate();
    return config;
}

AppConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        PMM_LOG_WARN("config file not found: " + path + ", using defaults");
        AppConfig config;
        config.strategy.validate();
        return config;
    }

    std::string content((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
    return parse_config(content);
}

} // namespace pmm
