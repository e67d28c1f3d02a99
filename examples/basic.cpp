#include <cowl/cowl.h>

#include <iostream>
#include <string>

using namespace cowl;

// Upper-case the text only if it contains lower-case characters.
CowString shout(std::string_view text) {
    CowString result{borrowed, text};
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] >= 'a' && text[i] <= 'z')
            result.make_mut()[i] = text[i] - 'a' + 'A';
    }
    return result;
}

int main(int argc, char** argv) {
    // owned and borrowed text read the same
    CowString o{owned, std::string{"owned"}};
    CowString b{borrowed, "borrowed"};
    std::cout << o.to_debug_str() << ' ' << b.to_debug_str() << std::endl;
    std::cout << "b == \"borrowed\": " << std::boolalpha << (b == "borrowed") << std::endl;

    // promotion copies the borrowed text once, on the first write
    std::string loud{"ALREADY LOUD"};
    for (auto text : {std::string_view{loud}, std::string_view{"quiet"}}) {
        auto result = shout(text);
        fmt::print("{:>14} -> {} ({})\n", text, result, result.type_name());
    }

    // round trip through the tagged string form
    auto data = serialize(b);
    auto copy = deserialize<CowString>(data);
    std::cout << data << " -> " << copy.to_debug_str() << std::endl;

    std::string s = std::move(b).into_owned();
    std::cout << s << std::endl;
}
