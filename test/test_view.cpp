#include <gtest/gtest.h>
#include <cowl/core/Cow.h>

#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

using namespace cowl;

namespace {

struct Person
{
    std::string name;
    int age;
};

template <typename C>
concept can_view = requires (const C& cow) { cow.as_view(); };

template <typename C>
concept can_borrow = requires (const C& cow) { cow.borrow(); };

template <typename C>
concept can_view_temporary = requires (C&& cow) { static_cast<C&&>(cow).as_view(); };

template <typename C>
concept can_deref_temporary = requires (C&& cow) { *static_cast<C&&>(cow); };

size_t length(std::string_view str) { return str.size(); }

} // namespace

namespace cowl {

// a borrow relation with no as-reference conversion
template <>
struct borrow_traits<Person, std::string>
{
    static const std::string& borrow(const Person& person) { return person.name; }
};

} // namespace cowl

static_assert(can_view<CowString>);
static_assert(can_borrow<CowString>);
static_assert(!can_view<Cow<Person, std::string>>);
static_assert(can_borrow<Cow<Person, std::string>>);

// a view of a temporary container would dangle once the container is destroyed
static_assert(!can_view_temporary<CowString>);
static_assert(!can_view_temporary<Cow<std::string>>);
static_assert(!can_deref_temporary<CowString>);
static_assert(!std::is_convertible_v<CowString, std::string_view>);
static_assert(std::is_convertible_v<const CowString&, std::string_view>);
static_assert(std::is_convertible_v<CowString&, std::string_view>);

TEST(View, AsViewOwned) {
    CowString c{owned, "owned"};
    EXPECT_EQ(c.as_view(), "owned");
    EXPECT_EQ(c.as_view().data(), c.owned_ptr()->data());
}

TEST(View, AsViewBorrowed) {
    std::string text{"borrowed"};
    CowString c{borrowed, text};
    EXPECT_EQ(c.as_view(), "borrowed");
    EXPECT_EQ(c.as_view().data(), text.data());
}

TEST(View, AsViewDoesNotCopy) {
    Cow<std::string> c{owned, "owned"};
    EXPECT_EQ(&c.as_view(), c.owned_ptr());
    EXPECT_TRUE(c.is_owned());
}

TEST(View, BorrowAgreesWithAsView) {
    std::string text{"text"};
    CowString b{borrowed, text};
    CowString o{owned, text};
    EXPECT_EQ(b.borrow().data(), b.as_view().data());
    EXPECT_EQ(o.borrow().data(), o.as_view().data());
    EXPECT_EQ(b.borrow(), o.borrow());
}

TEST(View, BorrowOnly) {
    Cow<Person, std::string> o{owned, Person{"Ada", 36}};
    EXPECT_EQ(o.borrow(), "Ada");

    std::string name{"Grace"};
    Cow<Person, std::string> b{borrowed, name};
    EXPECT_EQ(&b.borrow(), &name);
    EXPECT_TRUE(b.is_borrowed());
}

TEST(View, Dereference) {
    std::string text{"borrowed"};
    CowString b{borrowed, text};
    CowString o{owned, "owned"};
    EXPECT_EQ(*b, "borrowed");
    EXPECT_EQ(*o, "owned");
    EXPECT_EQ(b->size(), 8UL);
    EXPECT_EQ(o->substr(1, 2), "wn");
    EXPECT_TRUE(b->starts_with("bor"));
}

TEST(View, DereferenceSized) {
    Person person{"Ada", 36};
    Cow<Person> b{borrowed, person};
    EXPECT_EQ(b->age, 36);
    EXPECT_EQ(&*b, &person);
}

TEST(View, ImplicitConversion) {
    CowString c{borrowed, "four"};
    EXPECT_EQ(length(c), 4UL);
    std::string_view view = c;
    EXPECT_EQ(view, "four");
}

TEST(View, Span) {
    std::vector<int> values{3, 1, 2};
    CowVector<int> c{borrowed, values};
    std::span<const int> view = c.as_view();
    EXPECT_EQ(view.size(), 3UL);
    EXPECT_EQ(view[0], 3);
    EXPECT_EQ(c->front(), 3);

    c.make_mut()[0] = 9;
    EXPECT_EQ(c.as_view()[0], 9);
    EXPECT_EQ(values[0], 3);
}
