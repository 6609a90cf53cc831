// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Guided Lab Walk-through                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/lab.hpp"
#include "tabula/json_rows.hpp"
#include "tabula/log.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tabula::lab {

namespace {

struct User {
    std::string id;
    std::string name;
    std::int32_t age = 0;

    friend bool operator==(const User& lhs, const User& rhs) {
        return lhs.id == rhs.id && lhs.name == rhs.name && lhs.age == rhs.age;
    }
};

User to_user(const Row& row) {
    // value() throws on a missing or mistyped column; the exercise reports it
    return User{
        row.get_string("id").value(),
        row.get_string("name").value(),
        row.get_int("age").value(),
    };
}

bool has_id(const Row& row, const std::string& id) {
    auto value = row.get_string("id");
    return value && *value == id;
}

} // anonymous namespace

ResultSet sample_users() {
    std::vector<ColumnDescriptor> columns{
        {"id", TypeCode::Varchar},
        {"name", TypeCode::Varchar},
        {"age", TypeCode::Int},
    };

    const std::vector<std::pair<const char*, std::int32_t>> people{
        {"jon", 32}, {"mary", 25}, {"Emma-Sophie", 15}, {"Maria", 28},
        {"Mario", 39}, {"Elena", 31}, {"Andrew", 64}, {"Panagiotis", 66},
        {"Anastasios", 39}, {"Pierre", 77}, {"Logan", 58}, {"George", 62},
        {"Elise", 91}, {"Alan", 22}, {"Dimitrios", 38}, {"Georgios", 14},
    };

    std::vector<Row> rows;
    rows.reserve(people.size());
    for (std::size_t i = 0; i < people.size(); ++i) {
        // The first two users were inserted with hand-picked ids
        std::string id = i == 0 ? "123" : i == 1 ? "456" : std::to_string(i + 1);
        rows.emplace_back(columns, std::vector<Value>{
            std::move(id), std::string(people[i].first), people[i].second});
    }

    return ResultSet(std::move(columns), std::move(rows));
}

void run_guided_lab(Lab& lab, const ResultSet& users) {
    lab.section("Discovering the education.user table", [&] {
        lab.exercise_ignore("Create a keyspace", [&] {
            todo("create the education keyspace with one replica per node");
        });

        lab.exercise("Query data", [&] {
            lab.comment("List of all users");
            lab.display(users);

            lab.comment("Are all users there?");
            TABULA_CHECK(lab, users.row_count() == 16);
        });

        lab.exercise("Query data as JSON document", [&] {
            lab.comment("List of all users (JSON)");
            auto documents = json::json_view(users);
            lab.display(documents);

            TABULA_CHECK(lab, documents.columns().size() == 1);
            TABULA_CHECK(lab, documents.row_count() == users.row_count());
        });

        lab.exercise("Query with constraint", [&] {
            auto result = users.filter([](const Row& row) { return has_id(row, "123"); });

            lab.comment("Data collected");
            lab.display_rows(result.all());

            lab.comment("Did we get 1 user?");
            TABULA_CHECK(lab, result.row_count() == 1);
            lab.comment("Did the collected user have ID '123'?");
            TABULA_CHECK(lab, result.row_count() == 1 && has_id(result.all().front(), "123"));
        });

        lab.exercise("Use prepared statement", [&] {
            auto find_user_by_id = [&](const std::string& id) {
                auto result = users.filter([&](const Row& row) { return has_id(row, id); });

                lab.comment("Did we get 1 user?");
                TABULA_CHECK(lab, result.row_count() == 1);
                if (result.empty()) {
                    throw std::runtime_error("no user with id " + id);
                }
                return to_user(result.all().front());
            };

            auto user = find_user_by_id("123");
            lab.comment("Check collected data");
            TABULA_CHECK(lab, user == (User{"123", "jon", 32}));
        });

        lab.exercise("Find many users", [&] {
            auto find_users_by_ids = [&](const std::vector<std::string>& ids) {
                auto result = users.filter([&](const Row& row) {
                    return std::any_of(ids.begin(), ids.end(),
                        [&](const std::string& id) { return has_id(row, id); });
                });
                lab.display(result);

                std::vector<User> found;
                for (const auto& row : result) {
                    found.push_back(to_user(row));
                }
                return found;
            };

            auto found = find_users_by_ids({"123", "456"});
            lab.comment("Did we get both users?");
            TABULA_CHECK(lab, found.size() == 2);
            TABULA_CHECK(lab, std::any_of(found.begin(), found.end(),
                [](const User& u) { return u.name == "mary"; }));
        });

        lab.exercise("Query with constraint on non-key field", [&] {
            auto result = users.filter([](const Row& row) {
                auto age = row.get_int("age");
                return age && *age >= 30;
            });

            lab.comment("Users greater or equal to 30");
            lab.display(result);

            TABULA_CHECK(lab, result.row_count() == 11);
            TABULA_CHECK(lab, std::all_of(result.begin(), result.end(),
                [](const Row& row) { return to_user(row).age >= 30; }));
        });
    });

    log::info("Guided lab finished: {} passed, {} failed, {} todo, {} ignored",
        lab.summary().passed, lab.summary().failed, lab.summary().pending, lab.summary().ignored);
}

} // namespace tabula::lab
