#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace Catch;

namespace fixtures {

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
        std::vector<std::string> tags;
        Address addr;
    };

    void describe(Stanza::record_builder<Person>& b) {
        b.field("Name", &Person::name, "name")
         .field("Age", &Person::age, "age")
         .field("Tags", &Person::tags, "tags")
         .field("Addr", &Person::addr, "addr");
    }

    struct Scalars {
        std::string s;
        std::int8_t i8 = 0;
        std::int16_t i16 = 0;
        std::int32_t i32 = 0;
        std::int64_t i64 = 0;
        std::uint8_t u8 = 0;
        std::uint16_t u16 = 0;
        std::uint32_t u32 = 0;
        std::uint64_t u64 = 0;
        float f32 = 0;
        double f64 = 0;
        bool flag = false;
    };

    void describe(Stanza::record_builder<Scalars>& b) {
        b.field("S", &Scalars::s)
         .field("I8", &Scalars::i8)
         .field("I16", &Scalars::i16)
         .field("I32", &Scalars::i32)
         .field("I64", &Scalars::i64)
         .field("U8", &Scalars::u8)
         .field("U16", &Scalars::u16)
         .field("U32", &Scalars::u32)
         .field("U64", &Scalars::u64)
         .field("F32", &Scalars::f32)
         .field("F64", &Scalars::f64)
         .field("Flag", &Scalars::flag);
    }

    // Declaration order matters for the abort tests: label, count, note.
    struct Ordered {
        std::string label;
        int count = 0;
        std::string note;
    };

    void describe(Stanza::record_builder<Ordered>& b) {
        b.field("label", &Ordered::label)
         .field("count", &Ordered::count)
         .field("note", &Ordered::note);
    }

    struct Counter {
        int value = 0;
        std::string unit;
    };

    void describe(Stanza::record_builder<Counter>& b) {
        b.field("Value", &Counter::value, "value")
         .field("Unit", &Counter::unit, "unit");
    }

    struct Line {
        std::string sku;
        unsigned qty = 0;
    };

    void describe(Stanza::record_builder<Line>& b) {
        b.field("Sku", &Line::sku, "sku")
         .field("Qty", &Line::qty, "qty");
    }

    struct Order {
        std::string id;
        std::vector<Line> lines;
        std::vector<double> weights;
        std::vector<bool> flags;
        std::vector<int> codes;
        Counter counter;
        std::string after;
    };

    void describe(Stanza::record_builder<Order>& b) {
        b.field("Id", &Order::id, "id")
         .field("Lines", &Order::lines, "lines")
         .field("Weights", &Order::weights, "weights")
         .field("Flags", &Order::flags, "flags")
         .field("Codes", &Order::codes, "codes")
         .field("Counter", &Order::counter, "counter")
         .field("After", &Order::after, "after");
    }

    struct Envelope {
        std::string kind;
        Stanza::value payload;
        std::vector<Stanza::value> extras;
    };

    void describe(Stanza::record_builder<Envelope>& b) {
        b.field("Kind", &Envelope::kind, "kind")
         .field("Payload", &Envelope::payload, "payload")
         .field("Extras", &Envelope::extras, "extras");
    }

    struct Node {
        std::string name;
        std::vector<Node> children;
    };

    void describe(Stanza::record_builder<Node>& b) {
        b.field("name", &Node::name)
         .field("children", &Node::children);
    }

} // namespace fixtures

using fixtures::Address;
using fixtures::Person;
using fixtures::Scalars;
using fixtures::Ordered;
using fixtures::Order;
using fixtures::Envelope;
using fixtures::Node;
using Stanza::DecodeError;

TEST_CASE("Flat Scalars Decode Through Their Coercion Rules") {
    Scalars r;
    auto res = Stanza::decode(R"({
        "S": "hello",
        "I8": -12, "I16": 300, "I32": "-70000", "I64": 9007199254740991,
        "U8": 200, "U16": "65535", "U32": 4000000000, "U64": "18446744073709551615",
        "F32": 1.5, "F64": "2.25e2",
        "Flag": true
    })", r);

    REQUIRE(res);
    REQUIRE(r.s == "hello");
    REQUIRE(r.i8 == -12);
    REQUIRE(r.i16 == 300);
    REQUIRE(r.i32 == -70000);
    REQUIRE(r.i64 == 9007199254740991LL);
    REQUIRE(r.u8 == 200);
    REQUIRE(r.u16 == 65535);
    REQUIRE(r.u32 == 4000000000u);
    REQUIRE(r.u64 == std::numeric_limits<std::uint64_t>::max());
    REQUIRE(r.f32 == Approx(1.5f));
    REQUIRE(r.f64 == Approx(225.0));
    REQUIRE(r.flag);
}

TEST_CASE("Fractional Numbers Truncate Into Integer Fields") {
    Scalars r;
    REQUIRE(Stanza::decode(R"({"I32": 3.9, "I64": -3.9, "U16": 7.99})", r));
    REQUIRE(r.i32 == 3);
    REQUIRE(r.i64 == -3);
    REQUIRE(r.u16 == 7);
}

TEST_CASE("Narrow Integer Fields Wrap Around") {
    Scalars r;
    REQUIRE(Stanza::decode(R"({"I8": 130, "U8": 257, "U32": -1})", r));
    REQUIRE(r.i8 == -126);
    REQUIRE(r.u8 == 1);
    REQUIRE(r.u32 == std::numeric_limits<std::uint32_t>::max());
}

TEST_CASE("Missing Keys Leave Fields Untouched") {
    Scalars r;
    r.i32 = 7;
    r.s = "keep";
    r.flag = true;

    REQUIRE(Stanza::decode("{}", r));
    REQUIRE(r.i32 == 7);
    REQUIRE(r.s == "keep");
    REQUIRE(r.flag);
}

TEST_CASE("Unknown Keys Are Ignored") {
    Ordered r;
    REQUIRE(Stanza::decode(R"({"label":"a","unrelated":[1,2,{"x":null}]})", r));
    REQUIRE(r.label == "a");
    REQUIRE(r.count == 0);
}

TEST_CASE("Tag Wins Over Field Name") {
    Person p;
    REQUIRE(Stanza::decode(R"({"Name":"ignored","name":"Ann"})", p));
    REQUIRE(p.name == "Ann");
}

TEST_CASE("Tag Options After Comma Are Not Part of the Key") {
    Address a;
    REQUIRE(Stanza::decode(R"({"zip":"10001","zip,omitempty":"nope"})", a));
    REQUIRE(a.zip == "10001");
}

TEST_CASE("String and Sequence of Strings") {
    Person p;
    REQUIRE(Stanza::decode(R"({"name":"Ann","tags":["x","y"]})", p));
    REQUIRE(p.name == "Ann");
    REQUIRE(p.tags == std::vector<std::string>{ "x", "y" });
}

TEST_CASE("Nested Record Field") {
    Person p;
    REQUIRE(Stanza::decode(R"({"addr":{"city":"NYC"}})", p));
    REQUIRE(p.addr.city == "NYC");
}

TEST_CASE("Nested Record Is Replaced, Not Merged") {
    Person p;
    p.addr.zip = "99999";
    REQUIRE(Stanza::decode(R"({"addr":{"city":"NYC"}})", p));
    REQUIRE(p.addr.city == "NYC");
    REQUIRE(p.addr.zip.empty());
}

TEST_CASE("Non-Object Value for a Nested Record Is Skipped") {
    Person p;
    p.addr.city = "Boston";
    for (auto text : { R"({"addr":"NYC"})", R"({"addr":null})", R"({"addr":[1]})", R"({"addr":4})" }) {
        INFO("input: " << text);
        REQUIRE(Stanza::decode(text, p));
        REQUIRE(p.addr.city == "Boston");
    }
}

TEST_CASE("Non-Array Value for a Sequence Is Skipped") {
    Person p;
    p.tags = { "old" };
    REQUIRE(Stanza::decode(R"({"tags":"x"})", p));
    REQUIRE(p.tags == std::vector<std::string>{ "old" });
}

TEST_CASE("Sequence Replaces Previous Contents") {
    Person p;
    p.tags = { "a", "b", "c" };
    REQUIRE(Stanza::decode(R"({"tags":[]})", p));
    REQUIRE(p.tags.empty());
}

TEST_CASE("Re-Decoding Accumulates Disjoint Fields") {
    Person p;
    REQUIRE(Stanza::decode(R"({"name":"Ann"})", p));
    REQUIRE(Stanza::decode(R"({"age":41})", p));
    REQUIRE(p.name == "Ann");
    REQUIRE(p.age == 41);

    REQUIRE(Stanza::decode(R"({"name":"Bo"})", p));
    REQUIRE(p.name == "Bo");
    REQUIRE(p.age == 41);
}

TEST_CASE("String Field Rejects Numbers and Stops the Walk") {
    Ordered r;
    auto res = Stanza::decode(R"({"label":5,"count":3,"note":"n"})", r);

    REQUIRE_FALSE(res);
    REQUIRE(res.error().errc == DecodeError::code::type_mismatch);
    REQUIRE(res.error().path == "label");
    REQUIRE(res.error().actual == Stanza::kind::number);
    REQUIRE(r.label.empty());
    REQUIRE(r.count == 0);
    REQUIRE(r.note.empty());
}

TEST_CASE("Fields Before the Failure Stay Written") {
    Ordered r;
    auto res = Stanza::decode(R"({"label":"kept","count":"many","note":"n"})", r);

    REQUIRE_FALSE(res);
    REQUIRE(res.error().errc == DecodeError::code::coercion_error);
    REQUIRE(res.error().why == Stanza::CoercionError::reason::invalid_literal);
    REQUIRE(res.error().path == "count");
    REQUIRE(r.label == "kept");
    REQUIRE(r.note.empty());
}

TEST_CASE("String Field Is Never Stringified") {
    Ordered r;
    for (auto text : { R"({"label":true})", R"({"label":null})", R"({"label":["a"]})", R"({"label":{}})" }) {
        INFO("input: " << text);
        auto res = Stanza::decode(text, r);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == DecodeError::code::type_mismatch);
    }
}

TEST_CASE("Boolean Field Requires a JSON Boolean") {
    Scalars r;
    auto res = Stanza::decode(R"({"Flag":"true"})", r);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().errc == DecodeError::code::type_mismatch);
    REQUIRE(res.error().actual == Stanza::kind::string);
    REQUIRE_FALSE(r.flag);
}

TEST_CASE("Numeric Fields Reject Booleans and Null") {
    Scalars r;

    auto b = Stanza::decode(R"({"I32":true})", r);
    REQUIRE_FALSE(b);
    REQUIRE(b.error().errc == DecodeError::code::coercion_error);
    REQUIRE(b.error().why == Stanza::CoercionError::reason::unsupported_type);
    REQUIRE(b.error().actual == Stanza::kind::boolean);
    REQUIRE_THAT(b.error().msg, Matchers::ContainsSubstring("boolean"));

    auto n = Stanza::decode(R"({"F64":null})", r);
    REQUIRE_FALSE(n);
    REQUIRE(n.error().actual == Stanza::kind::null);

    auto u = Stanza::decode(R"({"U8":"-1"})", r);
    REQUIRE_FALSE(u);
    REQUIRE(u.error().why == Stanza::CoercionError::reason::invalid_literal);
}

TEST_CASE("Malformed Input") {
    Person p;

    SECTION("Invalid JSON") {
        auto res = Stanza::decode(R"({"name": "Ann",})", p);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == DecodeError::code::malformed_input);
        REQUIRE(res.error().parse.has_value());
        REQUIRE(res.error().path.empty());
    }

    SECTION("Empty input") {
        auto res = Stanza::decode("", p);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == DecodeError::code::malformed_input);
        REQUIRE(res.error().parse->errc == Stanza::ParseError::code::unexpected_end_of_input);
    }

    SECTION("Root is not an object") {
        for (auto text : { "[]", "null", "42", "\"text\"", "true" }) {
            INFO("input: " << text);
            auto res = Stanza::decode(text, p);
            REQUIRE_FALSE(res);
            REQUIRE(res.error().errc == DecodeError::code::malformed_input);
            REQUIRE_FALSE(res.error().parse.has_value());
        }
    }

    REQUIRE(p.name.empty());
}

TEST_CASE("Deep Nesting Under an Unread Key Is Rejected, Not Recursed") {
    Ordered r;
    std::string text = R"({"label":"x","deep":)" + std::string(100000, '[') + std::string(100000, ']') + "}";

    auto res = Stanza::decode(text, r);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().errc == DecodeError::code::malformed_input);
    REQUIRE(res.error().parse.has_value());
    REQUIRE(res.error().parse->errc == Stanza::ParseError::code::depth_limit_exceeded);
    REQUIRE(r.label.empty());

    Stanza::DecodeOptions opts;
    opts.parse.max_depth = 4;
    auto shallow = Stanza::decode(R"({"label":"y","deep":[[[]]]})", r, opts);
    REQUIRE(shallow);
    REQUIRE(r.label == "y");
}

TEST_CASE("Parse Options Are Forwarded") {
    Person p;
    Stanza::DecodeOptions opts;
    opts.parse.allow_comments = true;
    opts.parse.allow_trailing_commas = true;

    REQUIRE(Stanza::decode("{ // who\n \"name\": \"Ann\", }", p, opts));
    REQUIRE(p.name == "Ann");
}

TEST_CASE("Sequence of Records") {
    Order o;
    REQUIRE(Stanza::decode(R"({
        "id": "A-1",
        "lines": [ {"sku":"pen","qty":2}, {"sku":"ink","qty":"5"}, 17, {"sku":"cap"} ]
    })", o));

    REQUIRE(o.id == "A-1");
    REQUIRE(o.lines.size() == 4);
    REQUIRE(o.lines[0].sku == "pen");
    REQUIRE(o.lines[0].qty == 2);
    REQUIRE(o.lines[1].qty == 5);
    REQUIRE(o.lines[2].sku.empty());
    REQUIRE(o.lines[2].qty == 0);
    REQUIRE(o.lines[3].sku == "cap");
    REQUIRE(o.lines[3].qty == 0);
}

TEST_CASE("Scalar Sequence Elements Are Assigned Without Coercion") {
    Order o;

    SECTION("Matching kinds") {
        REQUIRE(Stanza::decode(R"({"weights":[0.5, 2, -1e3], "flags":[true,false,true]})", o));
        REQUIRE(o.weights == std::vector<double>{ 0.5, 2.0, -1000.0 });
        REQUIRE(o.flags == std::vector<bool>{ true, false, true });
    }

    SECTION("Numeric string in a double sequence") {
        o.weights = { 9.0 };
        auto res = Stanza::decode(R"({"weights":[1.0, "2.0"]})", o);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == DecodeError::code::type_mismatch);
        REQUIRE(res.error().path == "weights[1]");
        REQUIRE(o.weights == std::vector<double>{ 9.0 });
    }

    SECTION("Integer elements have no exact JSON counterpart") {
        auto res = Stanza::decode(R"({"codes":[1]})", o);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == DecodeError::code::type_mismatch);
        REQUIRE(res.error().path == "codes[0]");
    }

    SECTION("Empty integer sequence still decodes") {
        o.codes = { 4 };
        REQUIRE(Stanza::decode(R"({"codes":[]})", o));
        REQUIRE(o.codes.empty());
    }
}

TEST_CASE("Nested Errors Are Discarded by Default") {
    Order o;
    auto res = Stanza::decode(R"({
        "counter": {"value":4,"unit":9},
        "lines": [ {"sku":"pen","qty":true} ],
        "after": "reached"
    })", o);

    REQUIRE(res);
    // The nested walk stopped at "unit"; "value" was written before that.
    REQUIRE(o.counter.value == 4);
    REQUIRE(o.counter.unit.empty());
    REQUIRE(o.lines.size() == 1);
    REQUIRE(o.lines[0].sku == "pen");
    REQUIRE(o.after == "reached");
}

TEST_CASE("Nested Errors Propagate When Requested") {
    Stanza::DecodeOptions opts;
    opts.nested_errors = Stanza::NestedErrorPolicy::propagate;

    SECTION("Record field") {
        Order o;
        auto res = Stanza::decode(R"({"counter":{"value":"heavy"},"after":"never"})", o, opts);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == DecodeError::code::coercion_error);
        REQUIRE(res.error().path == "counter.value");
        REQUIRE(o.after.empty());
    }

    SECTION("Record element") {
        Order o;
        auto res = Stanza::decode(R"({"lines":[{"sku":"a"},{"sku":7}]})", o, opts);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == DecodeError::code::type_mismatch);
        REQUIRE(res.error().path == "lines[1].sku");
        REQUIRE(o.lines.empty());
    }

    SECTION("Valid input is unaffected") {
        Order o;
        REQUIRE(Stanza::decode(R"({"counter":{"value":3,"unit":"m"}})", o, opts));
        REQUIRE(o.counter.value == 3);
        REQUIRE(o.counter.unit == "m");
    }
}

TEST_CASE("Generic Value Members Keep Arbitrary JSON") {
    Envelope e;
    REQUIRE(Stanza::decode(R"({
        "kind": "event",
        "payload": {"id": 3, "tags": ["a", null]},
        "extras": [1, "two", false, null]
    })", e));

    REQUIRE(e.kind == "event");
    REQUIRE(e.payload.is_object());
    REQUIRE(e.payload.at("id").as_number() == Approx(3.0));
    REQUIRE(e.payload.at("tags").as_array().size() == 2);
    // The decode arena is gone; the copy must live in the member's own resource.
    REQUIRE(e.payload.resource() == std::pmr::get_default_resource());

    REQUIRE(e.extras.size() == 4);
    REQUIRE(e.extras[0].as_number() == Approx(1.0));
    REQUIRE(e.extras[1].as_string() == "two");
    REQUIRE(e.extras[2].is_bool());
    REQUIRE(e.extras[3].is_null());
}

TEST_CASE("Generic Value Member Accepts Null") {
    Envelope e;
    e.payload = Stanza::value{ 5.0 };
    REQUIRE(Stanza::decode(R"({"payload":null})", e));
    REQUIRE(e.payload.is_null());
}

TEST_CASE("Recursive Record Types") {
    Node root;
    REQUIRE(Stanza::decode(R"({
        "name": "root",
        "children": [
            {"name": "a", "children": [ {"name": "a1"} ]},
            {"name": "b"}
        ]
    })", root));

    REQUIRE(root.name == "root");
    REQUIRE(root.children.size() == 2);
    REQUIRE(root.children[0].children.size() == 1);
    REQUIRE(root.children[0].children[0].name == "a1");
    REQUIRE(root.children[1].children.empty());
}

TEST_CASE("Decode From an Existing Tree") {
    auto tree = Stanza::parse(R"({"name":"Ann","age":"30"})");
    REQUIRE(tree);

    Person p;
    REQUIRE(Stanza::decode_value(*tree, p));
    REQUIRE(p.name == "Ann");
    REQUIRE(p.age == 30);

    auto arr = Stanza::parse("[1]");
    REQUIRE(arr);
    auto res = Stanza::decode_value(*arr, p);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().errc == DecodeError::code::malformed_input);
    REQUIRE(res.error().actual == Stanza::kind::array);
}

TEST_CASE("Decode From a Stream") {
    std::istringstream in{ R"({"addr":{"city":"Oslo","zip":"0150"}})" };
    Person p;
    REQUIRE(Stanza::decode(in, p));
    REQUIRE(p.addr.city == "Oslo");
    REQUIRE(p.addr.zip == "0150");
}

TEST_CASE("decode_as Returns a Fresh Record") {
    auto ok = Stanza::decode_as<Person>(R"({"name":"Ann","age":41.7})");
    REQUIRE(ok);
    REQUIRE(ok->name == "Ann");
    REQUIRE(ok->age == 41);

    auto bad = Stanza::decode_as<Person>(R"({"age":{}})");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == DecodeError::code::coercion_error);
    REQUIRE(bad.error().path == "age");
}

TEST_CASE("Descriptor Table") {
    const auto& d = Stanza::descriptor_of<Person>();
    REQUIRE(d.size() == 4);

    const auto& fields = d.fields();
    REQUIRE(fields[0].info.name == "Name");
    REQUIRE(fields[0].info.key == "name");
    REQUIRE(fields[0].info.kind == Stanza::FieldKind::string);
    REQUIRE(fields[1].info.kind == Stanza::FieldKind::signed_integer);
    REQUIRE(fields[2].info.kind == Stanza::FieldKind::sequence);
    REQUIRE(fields[2].info.element == Stanza::FieldKind::string);
    REQUIRE(fields[3].info.kind == Stanza::FieldKind::record);

    // Built once, handed out by reference afterwards.
    REQUIRE(&Stanza::descriptor_of<Person>() == &d);

    const auto* zip = Stanza::descriptor_of<Address>().find("Zip");
    REQUIRE(zip != nullptr);
    REQUIRE(zip->tag == "zip,omitempty");
    REQUIRE(zip->key == "zip");
    REQUIRE(Stanza::descriptor_of<Address>().find("zip") == nullptr);

    const auto* s = Stanza::descriptor_of<Scalars>().find("S");
    REQUIRE(s != nullptr);
    REQUIRE(s->key == "S");
    REQUIRE(Stanza::descriptor_of<Scalars>().find("U64")->kind == Stanza::FieldKind::unsigned_integer);
    REQUIRE(Stanza::descriptor_of<Scalars>().find("F32")->kind == Stanza::FieldKind::floating);
    REQUIRE(Stanza::descriptor_of<Scalars>().find("Flag")->kind == Stanza::FieldKind::boolean);
    REQUIRE(Stanza::descriptor_of<Envelope>().find("Payload")->kind == Stanza::FieldKind::other);
}

TEST_CASE("Key Resolution") {
    REQUIRE(Stanza::resolve_key("City", "") == "City");
    REQUIRE(Stanza::resolve_key("City", "city") == "city");
    REQUIRE(Stanza::resolve_key("City", "city,omitempty") == "city");
    REQUIRE(Stanza::resolve_key("City", "city,omitempty,string") == "city");
    REQUIRE(Stanza::resolve_key("City", ",omitempty").empty());
    REQUIRE(Stanza::resolve_key("City", "-") == "-");
}

TEST_CASE("Error Messages Name the Field and Kinds") {
    Person p;
    auto res = Stanza::decode(R"({"name":["Ann"]})", p);
    REQUIRE_FALSE(res);
    REQUIRE_THAT(res.error().msg, Matchers::ContainsSubstring("name"));
    REQUIRE_THAT(res.error().msg, Matchers::ContainsSubstring("string"));
    REQUIRE_THAT(res.error().msg, Matchers::ContainsSubstring("array"));
    REQUIRE(Stanza::to_string(res.error().errc) == "type_mismatch");
}
