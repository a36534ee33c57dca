#include <tether/tether.hpp>
#include <nlohmann/json.hpp>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

// ============================================================================
// Model Definitions
// ============================================================================

struct Author {
    std::optional<tether::primary_key_t> id;
    std::string name;
    int16_t rank = 0;

    bool operator==(const Author&) const = default;
};
TETHER_ENTITY(Author, "authors", id, name, rank);

struct Book {
    std::optional<tether::primary_key_t> id;
    tether::references<Author, tether::on_delete_policy::cascade> author_id;
    std::string title;
    double price = 0.0;
    bool in_print = false;

    bool operator==(const Book&) const = default;
};
TETHER_ENTITY(Book, "books", id, author_id, title, price, in_print);

// No `name` member, short code
struct Tag {
    std::optional<tether::primary_key_t> id;
    tether::varchar<5> code;
    int64_t uses = 0;
};
TETHER_ENTITY(Tag, "tags", id, code, uses);

// Fields without a property type
struct Attachment {
    std::optional<tether::primary_key_t> id;
    std::string label;
    std::vector<uint8_t> data;
    tether::timestamp_t created;
};
TETHER_ENTITY(Attachment, "attachments", id, label, data, created);

struct Note {
    std::optional<tether::primary_key_t> id;
    tether::references<Attachment> attachment_id;
    std::string text;
};
TETHER_ENTITY(Note, "notes", id, attachment_id, text);

// Nullable columns, including a foreign key
struct Review {
    std::optional<tether::primary_key_t> id;
    std::optional<tether::references<Book, tether::on_delete_policy::set_null>> book_id;
    std::optional<int> stars;
    std::optional<std::string> comment;

    bool operator==(const Review&) const = default;
};
TETHER_ENTITY(Review, "reviews", id, book_id, stars, comment);

// Nothing but a key
struct Marker {
    std::optional<tether::primary_key_t> id;
};
TETHER_ENTITY(Marker, "markers", id);

// ============================================================================
// Helpers
// ============================================================================

// Authors, books and tags in a fresh in-memory database
struct library_fixture {
    std::shared_ptr<tether::database> db = std::make_shared<tether::database>();
    tether::entity_registry registry;
    tether::event_bus bus;
    tether::view_model_factory factory{registry};
    tether::repository repo{db, factory, bus};

    library_fixture() {
        registry.add<Author>();
        registry.add<Book>();
        registry.add<Tag>();
        registry.create_all(*db);
    }

    size_t count(const std::string& table) {
        auto rows = db->query("SELECT COUNT(*) AS n FROM " + table);
        return static_cast<size_t>(std::get<int64_t>(rows.front().at("n")));
    }
};

// Counts row writes (insert, update, delete) reaching SQLite
class write_counter {
public:
    explicit write_counter(tether::database& db) : db_(db) {
        sqlite3_update_hook(db_.handle(), &write_counter::on_write, this);
    }
    ~write_counter() {
        sqlite3_update_hook(db_.handle(), nullptr, nullptr);
    }

    int count = 0;

private:
    tether::database& db_;

    static void on_write(void* self, int, const char*, const char*, sqlite3_int64) {
        ++static_cast<write_counter*>(self)->count;
    }
};

#include "CollectionTests.hpp"

// ============================================================================
// Test: Type Mapper
// ============================================================================

void test_type_mapper_defaults() {
    std::cout << "Testing type mapper defaults..." << std::endl;

    tether::type_mapper mapper;
    assert(mapper.map(tether::column_type::integer) == tether::value_type::integer);
    assert(mapper.map(tether::column_type::small_integer) == tether::value_type::integer);
    assert(mapper.map(tether::column_type::big_integer) == tether::value_type::integer);
    assert(mapper.map(tether::column_type::text) == tether::value_type::text);
    assert(mapper.map(tether::column_type::real) == tether::value_type::real);
    assert(mapper.map(tether::column_type::boolean) == tether::value_type::boolean);
    assert(!mapper.map(tether::column_type::blob));
    assert(!mapper.map(tether::column_type::timestamp));

    std::cout << "  Type mapper defaults test passed!" << std::endl;
}

void test_type_mapper_custom_table() {
    std::cout << "Testing custom type mapper table..." << std::endl;

    // First matching family wins
    tether::type_mapper mapper({{tether::column_type::big_integer, tether::value_type::real}});
    mapper.add_mapping(tether::column_type::integer, tether::value_type::integer);

    assert(mapper.map(tether::column_type::big_integer) == tether::value_type::real);
    assert(mapper.map(tether::column_type::small_integer) == tether::value_type::integer);
    assert(!mapper.map(tether::column_type::text));
    assert(mapper.mappings().size() == 2);

    std::cout << "  Custom type mapper table test passed!" << std::endl;
}

void test_parse_value() {
    std::cout << "Testing text parsing..." << std::endl;
    using tether::value_type;

    assert(std::get<int64_t>(tether::parse_value(value_type::integer, "42")) == 42);
    assert(std::get<int64_t>(tether::parse_value(value_type::integer, "4x")) == 0);
    assert(std::get<int64_t>(tether::parse_value(value_type::integer, "-3")) == 0);
    assert(std::get<int64_t>(tether::parse_value(value_type::integer, "")) == 0);
    assert(std::get<double>(tether::parse_value(value_type::real, "2.5")) == 2.5);
    assert(std::get<double>(tether::parse_value(value_type::real, "abc")) == 0.0);
    assert(std::get<bool>(tether::parse_value(value_type::boolean, "Yes")));
    assert(std::get<bool>(tether::parse_value(value_type::boolean, "1")));
    assert(!std::get<bool>(tether::parse_value(value_type::boolean, "no")));
    assert(std::get<std::string>(tether::parse_value(value_type::text, " as is ")) == " as is ");

    assert(tether::format_value(int64_t{7}) == "7");
    assert(tether::format_value(true) == "true");
    assert(tether::format_value(std::string("x")) == "x");
    assert(tether::format_value(nullptr).empty());

    std::cout << "  Text parsing test passed!" << std::endl;
}

void test_coerce() {
    std::cout << "Testing value coercion..." << std::endl;
    using tether::value_type;

    auto r = tether::coerce(value_type::real, int64_t{3});
    assert(r && std::get<double>(*r) == 3.0);

    auto i = tether::coerce(value_type::integer, true);
    assert(i && std::get<int64_t>(*i) == 1);

    auto b = tether::coerce(value_type::boolean, int64_t{0});
    assert(b && !std::get<bool>(*b));

    assert(!tether::coerce(value_type::text, int64_t{1}));
    assert(!tether::coerce(value_type::integer, std::string("1")));
    assert(!tether::coerce(value_type::integer, nullptr));

    // NULL from the store stays null
    assert(tether::is_null(tether::to_property(value_type::text, nullptr)));
    assert(std::get<int64_t>(tether::to_property(value_type::integer, int64_t{4})) == 4);

    std::cout << "  Value coercion test passed!" << std::endl;
}

// ============================================================================
// Test: Schema and Registry
// ============================================================================

void test_entity_schema() {
    std::cout << "Testing entity schema..." << std::endl;

    const auto& schema = tether::entity_traits<Book>::schema();
    assert(schema.entity_name == "Book");
    assert(schema.table_name == "books");
    assert(schema.primary_key == "id");
    assert(schema.columns.size() == 5);
    assert(schema.columns[0].is_primary_key);

    const auto* author_id = schema.column("author_id");
    assert(author_id && author_id->is_foreign_key());
    assert(*author_id->foreign_key_table == "authors");
    assert(*author_id->foreign_key_column == "id");
    assert(author_id->on_delete == tether::on_delete_policy::cascade);

    const auto& tags = tether::entity_traits<Tag>::schema();
    assert(tags.column("code")->max_length == 5u);
    assert(tags.column("uses")->type == tether::column_type::big_integer);

    // Same address every call
    assert(&tether::entity_traits<Book>::schema() == &schema);

    std::cout << "  Entity schema test passed!" << std::endl;
}

void test_registry() {
    std::cout << "Testing entity registry..." << std::endl;

    tether::entity_registry registry;
    registry.add<Book>();
    registry.add<Author>();
    registry.add<Author>();
    assert(registry.all().size() == 2);

    assert(registry.find("Author") == &tether::entity_traits<Author>::schema());
    assert(registry.find_by_table("books") == &tether::entity_traits<Book>::schema());
    assert(registry.find("Nobody") == nullptr);

    auto dependents = registry.dependents(tether::entity_traits<Author>::schema());
    assert(dependents.size() == 1);
    assert(dependents[0].schema == &tether::entity_traits<Book>::schema());
    assert(dependents[0].column->name == "author_id");
    assert(registry.dependents(tether::entity_traits<Book>::schema()).empty());

    // Books registered first, still created after authors
    tether::database db;
    registry.create_all(db);
    assert(db.table_exists("authors"));
    assert(db.table_exists("books"));

    std::cout << "  Entity registry test passed!" << std::endl;
}

// ============================================================================
// Test: View-Model Factory
// ============================================================================

void test_derive_descriptor() {
    std::cout << "Testing descriptor derivation..." << std::endl;

    library_fixture f;
    auto books = f.factory.derive<Book>();
    assert(books->entity_name() == "Book");
    assert(books->primary_key() == "id");

    const auto& props = books->properties();
    assert(props.size() == 5);
    assert(props[0].name == "id" && props[0].is_primary_key);
    assert(props[1].name == "author_id" && props[1].type == tether::value_type::integer);
    assert(props[2].name == "title" && props[2].type == tether::value_type::text);
    assert(props[3].name == "price" && props[3].type == tether::value_type::real);
    assert(props[4].name == "in_print" && props[4].type == tether::value_type::boolean);

    assert(books->foreign_keys().size() == 1);
    assert(books->references("author_id") == &tether::entity_traits<Author>::schema());
    assert(books->depends_on(tether::entity_traits<Author>::schema()));
    assert(f.factory.derive<Author>()->foreign_keys().empty());

    // Memoized per entity type
    assert(f.factory.derive<Book>() == books);

    std::cout << "  Descriptor derivation test passed!" << std::endl;
}

void test_unmapped_fields_excluded() {
    std::cout << "Testing unmapped fields..." << std::endl;

    tether::entity_registry registry;
    registry.add<Attachment>();
    tether::view_model_factory factory(registry);

    auto d = factory.derive<Attachment>();
    assert(d->properties().size() == 2);
    assert(d->property("label") != nullptr);
    assert(d->property("data") == nullptr);
    assert(d->property("created") == nullptr);

    // Unmapped fields come back default-constructed
    Attachment a{5, "scan", {1, 2, 3}, tether::timestamp_t(std::chrono::seconds(100))};
    auto vm = factory.from_entity(a);
    auto back = vm->to_entity<Attachment>();
    assert(back.id == 5);
    assert(back.label == "scan");
    assert(back.data.empty());

    std::cout << "  Unmapped fields test passed!" << std::endl;
}

void test_unresolved_foreign_key() {
    std::cout << "Testing unresolved foreign key..." << std::endl;

    // Attachment is never registered
    tether::entity_registry registry;
    registry.add<Note>();
    tether::view_model_factory factory(registry);

    auto d = factory.derive<Note>();
    const auto* prop = d->property("attachment_id");
    assert(prop != nullptr);
    assert(!prop->is_foreign_key());
    assert(prop->type == tether::value_type::integer);
    assert(d->foreign_keys().empty());

    std::cout << "  Unresolved foreign key test passed!" << std::endl;
}

void test_create_with_init() {
    std::cout << "Testing keyword initialization..." << std::endl;

    library_fixture f;
    auto vm = f.factory.create<Author>({{"name", std::string("Le Guin")}, {"bogus", int64_t{1}}});
    assert(vm->is_pending());
    assert(std::get<int64_t>(vm->get("id")) == 0);
    assert(vm->get_as<std::string>("name") == "Le Guin");
    assert(vm->get_as<int64_t>("rank") == 0);
    assert(!vm->has_property("bogus"));

    auto book = f.factory.create<Book>();
    assert(book->get_as<std::string>("title").empty());
    assert(book->get_as<double>("price") == 0.0);
    assert(!book->get_as<bool>("in_print"));

    // Handles are unique
    assert(vm->handle() != book->handle());

    std::cout << "  Keyword initialization test passed!" << std::endl;
}

void test_property_errors() {
    std::cout << "Testing property errors..." << std::endl;

    library_fixture f;
    auto vm = f.factory.create<Book>();

    bool threw = false;
    try {
        vm->get("nope");
    } catch (const tether::model_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        vm->set("title", int64_t{12});
    } catch (const tether::model_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        vm->get_as<std::string>("price");
    } catch (const tether::model_error&) {
        threw = true;
    }
    assert(threw);

    // Numeric kinds coerce
    vm->set("price", int64_t{4});
    assert(vm->get_as<double>("price") == 4.0);
    vm->set("in_print", int64_t{1});
    assert(vm->get_as<bool>("in_print"));

    std::cout << "  Property errors test passed!" << std::endl;
}

void test_round_trip() {
    std::cout << "Testing entity round trip..." << std::endl;

    library_fixture f;
    Book book{7, 3, "The Dispossessed", 9.5, true};
    auto vm = f.factory.from_entity(book);
    assert(vm->key() == 7);
    assert(tether::view_model_factory::to_entity<Book>(*vm) == book);

    Author pending{std::nullopt, "Butler", 2};
    auto avm = f.factory.from_entity(pending);
    assert(avm->is_pending());
    auto back = avm->to_entity<Author>();
    assert(!back.id.has_value());
    assert(back == pending);

    // Wrong entity type
    bool threw = false;
    try {
        vm->to_entity<Author>();
    } catch (const tether::model_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Entity round trip test passed!" << std::endl;
}

void test_nullable_round_trip() {
    std::cout << "Testing nullable fields round trip..." << std::endl;

    library_fixture f;
    f.registry.add<Review>();

    auto d = f.factory.derive<Review>();
    assert(d->property("stars")->nullable);
    assert(d->property("book_id")->nullable);
    assert(d->references("book_id") == &tether::entity_traits<Book>::schema());
    assert(!f.factory.derive<Author>()->property("name")->nullable);

    Review empty{9, std::nullopt, std::nullopt, std::nullopt};
    auto vm = f.factory.from_entity(empty);
    assert(tether::is_null(vm->get("stars")));
    assert(tether::is_null(vm->get("comment")));
    assert(tether::is_null(vm->get("book_id")));
    assert(vm->to_entity<Review>() == empty);

    Review full{9, 3, 4, std::string("Dense")};
    assert(f.factory.from_entity(full)->to_entity<Review>() == full);

    // New view models start out null
    auto fresh = f.factory.create<Review>({{"comment", std::string("Short")}});
    assert(tether::is_null(fresh->get("stars")));
    assert(fresh->get_as<std::string>("comment") == "Short");

    int changes = 0;
    auto token = fresh->observe([&](const tether::view_model&, const std::string&) { ++changes; });
    fresh->set("comment", nullptr);
    assert(tether::is_null(fresh->get("comment")));
    fresh->set("comment", nullptr);
    assert(changes == 1);

    // Empty text clears a nullable property
    fresh->set_text("stars", "3");
    assert(fresh->get_as<int64_t>("stars") == 3);
    fresh->set_text("stars", "");
    assert(tether::is_null(fresh->get("stars")));
    assert(changes == 3);

    // Only nullable properties take null
    auto author = f.factory.create<Author>();
    bool threw = false;
    try {
        author->set("name", nullptr);
    } catch (const tether::model_error&) {
        threw = true;
    }
    assert(threw);
    author->set_text("name", "");
    assert(author->get_as<std::string>("name").empty());

    std::cout << "  Nullable fields round trip test passed!" << std::endl;
}

void test_nullable_fields_stored() {
    std::cout << "Testing nullable fields in the store..." << std::endl;

    library_fixture f;
    f.registry.add<Review>();
    f.registry.create_all(*f.db);

    auto author = f.factory.create<Author>({{"name", std::string("Vance")}});
    f.repo.save<Author>({author});
    auto book = f.factory.create<Book>({{"author_id", *author->key()}, {"title", std::string("Lyonesse")}});
    f.repo.save<Book>({book});

    auto blank = f.factory.create<Review>();
    auto rated = f.factory.create<Review>({{"book_id", *book->key()}, {"stars", int64_t{5}}});
    f.repo.save<Review>({blank, rated});

    // NULL is written, not 0 or ""
    auto rows = f.db->query("SELECT book_id, stars, comment FROM reviews ORDER BY id");
    assert(rows.size() == 2);
    assert(std::holds_alternative<std::nullptr_t>(rows[0].at("book_id")));
    assert(std::holds_alternative<std::nullptr_t>(rows[0].at("stars")));
    assert(std::holds_alternative<std::nullptr_t>(rows[0].at("comment")));
    assert(std::get<int64_t>(rows[1].at("stars")) == 5);

    auto fetched = f.repo.fetch_all<Review>();
    assert(fetched.size() == 2);
    auto first = fetched[0]->to_entity<Review>();
    assert(!first.book_id && !first.stars && !first.comment);
    assert(fetched[0]->to_entity<Review>() == blank->to_entity<Review>());
    auto second = fetched[1]->to_entity<Review>();
    assert(second.book_id && second.book_id->key == *book->key());
    assert(second.stars == 5);
    assert(!second.comment);

    // Deleting the book nulls the reference
    f.repo.remove<Book>({book});
    assert(tether::is_null(f.repo.fetch_all<Review>()[1]->get("book_id")));
    assert(f.count("reviews") == 2);

    std::cout << "  Nullable fields in the store test passed!" << std::endl;
}

void test_key_only_entity() {
    std::cout << "Testing entity without fields..." << std::endl;

    library_fixture f;
    f.registry.add<Marker>();
    f.registry.create_all(*f.db);

    const auto& schema = tether::entity_traits<Marker>::schema();
    assert(schema.columns.size() == 1);
    assert(schema.columns[0].is_primary_key);

    auto a = f.factory.create<Marker>();
    auto b = f.factory.create<Marker>();
    f.repo.save<Marker>({a, b});
    assert(*a->key() > 0 && *b->key() > *a->key());

    // Saving a stored key-only row changes nothing
    f.repo.save<Marker>({a});
    assert(f.count("markers") == 2);
    assert(f.repo.fetch_all<Marker>()[1]->to_entity<Marker>().id == b->key());

    std::cout << "  Entity without fields test passed!" << std::endl;
}

void test_primary_key_property() {
    std::cout << "Testing primary key property..." << std::endl;

    library_fixture f;
    auto vm = f.factory.create<Author>();
    assert(vm->is_pending());

    vm->set("id", int64_t{5});
    assert(vm->key() == 5);
    assert(vm->get_as<int64_t>("id") == 5);

    // 0 means pending again
    vm->set("id", int64_t{0});
    assert(vm->is_pending());
    assert(!vm->to_entity<Author>().id.has_value());

    std::cout << "  Primary key property test passed!" << std::endl;
}

void test_view_model_observation() {
    std::cout << "Testing view model observation..." << std::endl;

    library_fixture f;
    auto vm = f.factory.create<Author>();
    std::vector<std::string> changed;

    {
        auto token = vm->observe([&](const tether::view_model&, const std::string& property) {
            changed.push_back(property);
        });
        vm->set("name", std::string("Delany"));
        vm->set("name", std::string("Delany"));  // unchanged, silent
        vm->set_text("rank", "3");
        vm->set_key(11);
        assert(changed.size() == 3);
        assert(changed[0] == "name");
        assert(changed[1] == "rank");
        assert(changed[2] == "id");
    }

    // Token gone, no more callbacks
    vm->set("name", std::string("Jemisin"));
    assert(changed.size() == 3);

    std::cout << "  View model observation test passed!" << std::endl;
}

// ============================================================================
// Test: Event Bus
// ============================================================================

void test_event_bus_order() {
    std::cout << "Testing event bus delivery order..." << std::endl;

    tether::event_bus bus;
    std::vector<int> calls;
    auto first = bus.subscribe([&](const tether::change_notification&) { calls.push_back(1); });
    auto second = bus.subscribe([&](const tether::change_notification&) { calls.push_back(2); });
    assert(bus.subscriber_count() == 2);

    bus.publish({&tether::entity_traits<Author>::schema()});
    assert(calls.size() == 2);
    assert(calls[0] == 1 && calls[1] == 2);

    first.unregister();
    assert(!first.is_valid());
    bus.publish({&tether::entity_traits<Author>::schema()});
    assert(calls.size() == 3 && calls[2] == 2);

    std::cout << "  Event bus delivery order test passed!" << std::endl;
}

void test_event_bus_reentrancy() {
    std::cout << "Testing event bus changes during delivery..." << std::endl;

    tether::event_bus bus;
    int late_calls = 0;
    int second_calls = 0;
    tether::notification_token second;
    tether::notification_token late;

    auto first = bus.subscribe([&](const tether::change_notification&) {
        // Removed before its turn: skipped. Added now: next publish only.
        second.unregister();
        if (!late) {
            late = bus.subscribe([&](const tether::change_notification&) { ++late_calls; });
        }
    });
    second = bus.subscribe([&](const tether::change_notification&) { ++second_calls; });

    bus.publish({nullptr});
    assert(second_calls == 0);
    assert(late_calls == 0);

    bus.publish({nullptr});
    assert(late_calls == 1);

    std::cout << "  Event bus changes during delivery test passed!" << std::endl;
}

// ============================================================================
// Test: Repository
// ============================================================================

void test_save_inserts_and_writes_back_key() {
    std::cout << "Testing save of a new row..." << std::endl;

    library_fixture f;
    std::vector<const tether::entity_schema*> seen;
    auto token = f.repo.subscribe([&](const tether::change_notification& n) { seen.push_back(n.entity); });

    auto vm = f.factory.create<Author>({{"name", std::string("Tiptree")}});
    assert(vm->to_entity<Author>().id == std::nullopt);

    f.repo.save<Author>({vm});
    assert(!vm->is_pending());
    assert(*vm->key() > 0);
    assert(vm->get_as<int64_t>("id") == *vm->key());
    assert(f.count("authors") == 1);

    assert(seen.size() == 1);
    assert(seen[0] == &tether::entity_traits<Author>::schema());
    assert(!f.db->is_in_transaction());

    std::cout << "  Save of a new row test passed!" << std::endl;
}

void test_save_updates_existing_row() {
    std::cout << "Testing save of a stored row..." << std::endl;

    library_fixture f;
    auto vm = f.factory.create<Author>({{"name", std::string("Russ")}});
    f.repo.save<Author>({vm});
    auto key = vm->key();

    vm->set("name", std::string("Joanna Russ"));
    f.repo.save<Author>({vm});
    assert(vm->key() == key);
    assert(f.count("authors") == 1);

    auto all = f.repo.fetch_all<Author>();
    assert(all.size() == 1);
    assert(all[0]->get_as<std::string>("name") == "Joanna Russ");
    assert(all[0]->key() == key);

    std::cout << "  Save of a stored row test passed!" << std::endl;
}

void test_save_batch_keys_by_position() {
    std::cout << "Testing batch key write-back..." << std::endl;

    library_fixture f;
    auto a = f.factory.create<Author>({{"name", std::string("A")}});
    auto b = f.factory.create<Author>({{"name", std::string("B")}});
    auto c = f.factory.create<Author>({{"name", std::string("C")}});
    f.repo.save<Author>({a, b, c});

    assert(*a->key() < *b->key() && *b->key() < *c->key());
    auto all = f.repo.fetch_all<Author>();
    assert(all.size() == 3);
    assert(all[1]->get_as<std::string>("name") == "B");
    assert(all[1]->key() == b->key());

    std::cout << "  Batch key write-back test passed!" << std::endl;
}

void test_empty_batch_is_noop() {
    std::cout << "Testing empty batches..." << std::endl;

    library_fixture f;
    int notifications = 0;
    auto token = f.repo.subscribe([&](const tether::change_notification&) { ++notifications; });

    f.repo.save<Author>({});
    f.repo.remove<Author>({});
    assert(notifications == 0);

    std::cout << "  Empty batches test passed!" << std::endl;
}

void test_heterogeneous_batch_rejected() {
    std::cout << "Testing mixed batch rejection..." << std::endl;

    library_fixture f;
    int notifications = 0;
    auto token = f.repo.subscribe([&](const tether::change_notification&) { ++notifications; });

    auto author = f.factory.create<Author>({{"name", std::string("Vinge")}});
    auto book = f.factory.create<Book>({{"title", std::string("Deepness")}});

    bool threw = false;
    try {
        f.repo.save<Author>({author, book});
    } catch (const tether::model_error&) {
        threw = true;
    }
    assert(threw);
    assert(author->is_pending());
    assert(f.count("authors") == 0);
    assert(notifications == 0);

    threw = false;
    try {
        f.repo.remove<Book>({author});
    } catch (const tether::model_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Mixed batch rejection test passed!" << std::endl;
}

void test_constraint_violation_rolls_back() {
    std::cout << "Testing constraint violation rollback..." << std::endl;

    library_fixture f;
    int notifications = 0;
    auto token = f.repo.subscribe([&](const tether::change_notification&) { ++notifications; });

    auto ok = f.factory.create<Tag>({{"code", std::string("sf")}});
    auto too_long = f.factory.create<Tag>({{"code", std::string("speculative")}});

    bool threw = false;
    try {
        f.repo.save<Tag>({ok, too_long});
    } catch (const tether::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(ok->is_pending());
    assert(too_long->is_pending());
    assert(f.count("tags") == 0);
    assert(notifications == 0);
    assert(!f.db->is_in_transaction());

    std::cout << "  Constraint violation rollback test passed!" << std::endl;
}

void test_remove_pending_touches_nothing() {
    std::cout << "Testing delete of an unsaved row..." << std::endl;

    library_fixture f;
    std::vector<const tether::entity_schema*> seen;
    auto token = f.repo.subscribe([&](const tether::change_notification& n) { seen.push_back(n.entity); });

    auto vm = f.factory.create<Author>({{"name", std::string("Nobody yet")}});
    write_counter writes(*f.db);
    f.repo.remove<Author>({vm});
    assert(writes.count == 0);
    assert(!f.db->is_in_transaction());

    // No storage call, still one notice for the type
    assert(seen.size() == 1);
    assert(seen[0] == &tether::entity_traits<Author>::schema());

    std::cout << "  Delete of an unsaved row test passed!" << std::endl;
}

void test_begin_gives_up_when_busy() {
    std::cout << "Testing begin under a held write lock..." << std::endl;

    auto path = std::filesystem::temp_directory_path() / "tether_busy_test.db";
    std::filesystem::remove(path);
    {
        tether::database writer(path.string());
        tether::database waiter(path.string());
        waiter.set_busy_timeout(10);

        tether::transaction held(writer);

        bool threw = false;
        try {
            waiter.begin_transaction();
        } catch (const tether::db_error&) {
            threw = true;
        }
        assert(threw);
        assert(!waiter.is_in_transaction());
        held.commit();

        // Released: the waiter gets the lock
        tether::transaction next(waiter);
        assert(waiter.is_in_transaction());
        next.commit();
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");

    std::cout << "  Begin under a held write lock test passed!" << std::endl;
}

void test_remove_and_cascade() {
    std::cout << "Testing delete with cascade..." << std::endl;

    library_fixture f;
    auto author = f.factory.create<Author>({{"name", std::string("Herbert")}});
    f.repo.save<Author>({author});
    auto book = f.factory.create<Book>({{"author_id", *author->key()}, {"title", std::string("Dune")}});
    f.repo.save<Book>({book});
    assert(f.count("books") == 1);

    std::vector<const tether::entity_schema*> seen;
    auto token = f.repo.subscribe([&](const tether::change_notification& n) { seen.push_back(n.entity); });

    f.repo.remove<Author>({author});
    assert(f.count("authors") == 0);
    assert(f.count("books") == 0);
    assert(seen.size() == 1);
    assert(seen[0] == &tether::entity_traits<Author>::schema());

    // Already gone: treated as deleted
    f.repo.remove<Book>({book});
    assert(seen.size() == 2);

    std::cout << "  Delete with cascade test passed!" << std::endl;
}

void test_fetch_all_order_and_read() {
    std::cout << "Testing fetch and read..." << std::endl;

    library_fixture f;
    for (const char* name : {"Zelazny", "Asimov", "Moorcock"}) {
        f.repo.save<Author>({f.factory.create<Author>({{"name", std::string(name)}})});
    }

    int notifications = 0;
    auto token = f.repo.subscribe([&](const tether::change_notification&) { ++notifications; });

    auto all = f.repo.fetch_all<Author>();
    assert(all.size() == 3);
    assert(all[0]->get_as<std::string>("name") == "Zelazny");
    assert(all[2]->get_as<std::string>("name") == "Moorcock");
    assert(*all[0]->key() < *all[1]->key());
    assert(notifications == 0);

    int64_t total = 0;
    f.repo.read([&](tether::database& db) {
        auto rows = db.query("SELECT COUNT(*) AS n FROM authors");
        total = std::get<int64_t>(rows.front().at("n"));
    });
    assert(total == 3);
    assert(!f.db->is_in_transaction());

    std::cout << "  Fetch and read test passed!" << std::endl;
}

void test_subscriber_calls_back_into_repository() {
    std::cout << "Testing repository use from a subscriber..." << std::endl;

    library_fixture f;
    size_t seen_rows = 0;
    auto token = f.repo.subscribe([&](const tether::change_notification& n) {
        if (n.is<Author>()) {
            seen_rows = f.repo.fetch_all<Author>().size();
        }
    });

    f.repo.save<Author>({f.factory.create<Author>({{"name", std::string("Wolfe")}})});
    assert(seen_rows == 1);

    std::cout << "  Repository use from a subscriber test passed!" << std::endl;
}

// ============================================================================
// Test: Configuration
// ============================================================================

void test_configuration_from_json() {
    std::cout << "Testing configuration parsing..." << std::endl;

    auto config = tether::configuration::from_json(nlohmann::json::parse(R"({
        "database": { "path": "stock.db", "foreign_keys": false, "busy_timeout_ms": 250 },
        "log_level": "Warn",
        "extra": [1, 2, 3]
    })"));
    assert(config.path == "stock.db");
    assert(!config.foreign_keys);
    assert(config.busy_timeout_ms == 250);
    assert(config.level == tether::log_level::warn);

    auto defaults = tether::configuration::from_json(nlohmann::json::object());
    assert(defaults.path == ":memory:");
    assert(defaults.foreign_keys);
    assert(defaults.busy_timeout_ms == 5000);
    assert(defaults.level == tether::log_level::off);

    bool threw = false;
    try {
        tether::configuration::from_json(nlohmann::json::parse(R"({"log_level": "loud"})"));
    } catch (const tether::config_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tether::configuration::from_json(nlohmann::json::parse(R"({"database": {"path": 3}})"));
    } catch (const tether::config_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Configuration parsing test passed!" << std::endl;
}

void test_configuration_file() {
    std::cout << "Testing configuration file..." << std::endl;

    auto path = std::filesystem::temp_directory_path() / "tether_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"database": {"path": ":memory:"}, "log_level": "error"})";
    }
    auto config = tether::load_configuration(path.string());
    assert(config.level == tether::log_level::error);

    auto db = tether::open_database(config);
    assert(db->foreign_keys_enabled());
    std::filesystem::remove(path);

    bool threw = false;
    try {
        tether::load_configuration(path.string());
    } catch (const tether::config_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Configuration file test passed!" << std::endl;
}

void test_parse_log_level() {
    std::cout << "Testing log level names..." << std::endl;

    assert(tether::parse_log_level("debug") == tether::log_level::debug);
    assert(tether::parse_log_level("WARNING") == tether::log_level::warn);
    assert(tether::parse_log_level("off") == tether::log_level::off);
    assert(!tether::parse_log_level("verbose"));

    std::cout << "  Log level names test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== TetherCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Type mapper
        test_type_mapper_defaults();
        test_type_mapper_custom_table();
        test_parse_value();
        test_coerce();

        // Schema
        test_entity_schema();
        test_registry();

        // View models
        test_derive_descriptor();
        test_unmapped_fields_excluded();
        test_unresolved_foreign_key();
        test_create_with_init();
        test_property_errors();
        test_round_trip();
        test_nullable_round_trip();
        test_primary_key_property();
        test_view_model_observation();

        // Event bus
        test_event_bus_order();
        test_event_bus_reentrancy();

        // Repository
        test_save_inserts_and_writes_back_key();
        test_save_updates_existing_row();
        test_save_batch_keys_by_position();
        test_nullable_fields_stored();
        test_key_only_entity();
        test_empty_batch_is_noop();
        test_heterogeneous_batch_rejected();
        test_constraint_violation_rolls_back();
        test_remove_pending_touches_nothing();
        test_begin_gives_up_when_busy();
        test_remove_and_cascade();
        test_fetch_all_order_and_read();
        test_subscriber_calls_back_into_repository();

        // Collections, edit sessions, choices
        run_collection_tests();

        // Configuration
        test_configuration_from_json();
        test_configuration_file();
        test_parse_log_level();

        std::cout << std::endl;
        std::cout << "=== All tests passed! ===" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
