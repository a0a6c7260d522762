#include <iostream>
#include <memory>
#include <string>

#include "stasis/handlers/handler_registry.hpp"
#include "stasis/handlers/reduce_handler.hpp"
#include "stasis/log/logger.hpp"
#include "stasis/serialization/session.hpp"
#include "stasis/types/duration.hpp"
#include "stasis/types/ordered_map.hpp"
#include "stasis/types/temporal.hpp"
#include "stasis/types/timezone.hpp"

using namespace stasis::serialization;

// Example user type, rebuilt through its factory from (name, level, joined)
class Player : public Reconstructible {
public:
    Player(std::string name, std::int64_t level,
           std::shared_ptr<const stasis::types::DateTime> joined)
        : name_(std::move(name)), level_(level), joined_(std::move(joined)) {}

    Reduction reduce() const override {
        return {factory(), {Value(name_), Value(level_), Value(joined_)}};
    }

    std::string str() const override {
        return "Player(" + name_ + ", level " + std::to_string(level_) + ")";
    }

    bool equals(const Object& other) const override {
        const auto* player = dynamic_cast<const Player*>(&other);
        return player != nullptr && player->name_ == name_ &&
               player->level_ == level_ && Value(player->joined_) == Value(joined_);
    }

    static const std::shared_ptr<const Factory>& factory() {
        static const auto instance = make_factory(
            "example.Player", [](const Value::List& args) -> Value {
                return std::make_shared<const Player>(
                    args.at(0).as_string(), args.at(1).as_int(),
                    args.at(2).as<stasis::types::DateTime>());
            });
        return instance;
    }

private:
    std::string name_;
    std::int64_t level_;
    std::shared_ptr<const stasis::types::DateTime> joined_;
};

STASIS_REGISTER_HANDLER(Player, stasis::handlers::ReduceHandler)

int main(int argc, char* argv[]) {
    auto& config_manager = stasis::config::ConfigManager::instance();
    auto log_config = stasis::config::ConfigurationPropertiesFactory<
        stasis::log::LogConfig>::create_and_register();
    auto session_config = stasis::config::ConfigurationPropertiesFactory<
        SessionConfig>::create_and_register();

    try {
        if (argc > 1) {
            config_manager.load_config(argv[1]);
        }
        stasis::log::Logger::init(*log_config);

        TypeCatalog::instance().add<Player>(Player::factory());

        auto joined = std::make_shared<const stasis::types::DateTime>(
            2023, 1, 1, 9, 30, 0, 0, stasis::types::TimeZone::utc());
        auto roster = std::make_shared<stasis::types::OrderedMap>();
        roster->set("captain", std::make_shared<const Player>("Ada", 42, joined));
        roster->set("session_length",
                    std::make_shared<const stasis::types::Duration>(0, 5400));

        Value original(std::shared_ptr<const stasis::types::OrderedMap>(roster));

        Session session(*session_config);
        const std::string text = session.encode(original);
        std::cout << "Encoded: " << text << std::endl;

        Value restored = session.decode(text);
        std::cout << "Restored: " << restored.str() << std::endl;
        std::cout << "Round trip "
                  << (restored == original ? "matches" : "DIFFERS") << std::endl;

        std::cout << "Lossy: " << encode(original, false) << std::endl;

        stasis::log::Logger::shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
