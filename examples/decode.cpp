#include <print>
#include <fstream>
#include <string>
#include <vector>

#include "stanza/stanza.hpp"

namespace demo {

    struct Address {
        std::string city;
        std::string zip;
    };

    void describe(Stanza::record_builder<Address>& b) {
        b.field("City", &Address::city, "city")
         .field("Zip", &Address::zip, "zip,omitempty");
    }

    struct Person {
        std::string name;
        int age = 0;
        double score = 0.0;
        bool active = false;
        std::vector<std::string> tags;
        Address addr;
        Stanza::value extra;
    };

    void describe(Stanza::record_builder<Person>& b) {
        b.field("Name", &Person::name, "name")
         .field("Age", &Person::age, "age")
         .field("Score", &Person::score, "score")
         .field("Active", &Person::active, "active")
         .field("Tags", &Person::tags, "tags")
         .field("Addr", &Person::addr, "addr")
         .field("Extra", &Person::extra, "extra");
    }

    void print(const Person& p) {
        std::println("name   = {}", p.name);
        std::println("age    = {}", p.age);
        std::println("score  = {}", p.score);
        std::println("active = {}", p.active);
        for (const auto& t : p.tags) std::println("tag    = {}", t);
        std::println("city   = {}", p.addr.city);
        std::println("zip    = {}", p.addr.zip);
        std::println("extra  = {}", Stanza::dump(p.extra));
    }

} // namespace demo

int main(int argc, char** argv) {
    demo::Person p;
    auto r = Stanza::decode(R"({
        "name": "Ann",
        "age": "41",
        "score": 97.5,
        "active": true,
        "tags": ["admin", "ops"],
        "addr": { "city": "NYC", "zip": "10001" },
        "extra": { "note": [1, 2, 3] }
    })", p);
    if (!r) {
        std::println("Decode error! -> {}", r.error().msg);
        return 1;
    }
    demo::print(p);

    // Numeric fields reject booleans.
    demo::Person bad;
    auto mismatch = Stanza::decode(R"({"name":"Bob","age":true})", bad);
    if (!mismatch)
        std::println("\n{} ({}) at '{}'", mismatch.error().msg, Stanza::to_string(mismatch.error().errc), mismatch.error().path);

    if (argc < 2) return 0;

    std::ifstream ifs(argv[1]);
    if (!ifs) {
        std::println("Failed to open {}", argv[1]);
        return -1;
    }

    demo::Person from_file;
    Stanza::DecodeOptions opts{ .parse = { .allow_comments = true, .allow_trailing_commas = true },
                                .nested_errors = Stanza::NestedErrorPolicy::propagate };
    auto file_r = Stanza::decode(ifs, from_file, opts);
    if (!file_r) {
        std::println("Decode error! -> {}", file_r.error().msg);
        return 1;
    }

    std::println("");
    demo::print(from_file);
    return 0;
}
