#pragma once


/*
    ------------------------------------------------
    Stanza - typed JSON record decoder for modern C++
    ------------------------------------------------

    This is the umbrella header. It pulls in:
        - The generic value tree:     `Stanza::value`        (value.hpp)
        - Error types:                `Stanza::ParseError`,
                                      `Stanza::CoercionError`,
                                      `Stanza::DecodeError`  (error.hpp)
        - Reader / writer:            `Stanza::parse`, `Stanza::dump` (json.hpp)
        - Options:                    `Stanza::ParseOptions`,
                                      `Stanza::WriteOptions`,
                                      `Stanza::DecodeOptions` (options.hpp)
        - Scalar coercion:            `to_integer`, `to_unsigned_integer`,
                                      `to_float`             (coerce.hpp)
        - Record descriptors:         `Stanza::record_builder`,
                                      `Stanza::descriptor_of` (record.hpp)
        - The typed decoder:          `Stanza::decode`,
                                      `Stanza::decode_as`    (decode.hpp)

    -----
    Usage
    -----
        struct Address { std::string city; };
        struct Person  { std::string name; int age = 0; Address addr; };

        void describe(Stanza::record_builder<Address>& b) {
            b.field("City", &Address::city, "city");
        }
        void describe(Stanza::record_builder<Person>& b) {
            b.field("Name", &Person::name, "name")
             .field("Age",  &Person::age,  "age,omitempty")
             .field("Addr", &Person::addr, "addr");
        }

        Person p;
        if (auto r = Stanza::decode(R"({"name":"Ann","age":"41"})", p); !r)
            std::println("{}", r.error().msg);
*/

#include "stanza/value.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/json.hpp"
#include "stanza/coerce.hpp"
#include "stanza/record.hpp"
#include "stanza/decode.hpp"
