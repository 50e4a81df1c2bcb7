/**
 * @brief utility to log anomalies
 * (Errors, Warnings, Unexpected situations)
 * so that infallible geometry routines can report suspicious data
 * without throwing
 */
#pragma once
#include <cstddef>
#include <iostream>
#include <memory>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/format.h>
namespace hyperbox::util {

    class AbstractAnomaly {
        friend class AnomalyLog;

        public:
        virtual ~AbstractAnomaly() = default;
        private:
        virtual void handle_self(std::ostream &log_out) = 0;

    };

    template<class Data>
    class Anomaly : public AbstractAnomaly {
    private:
        std::string desc;
        Data user_data;
        std::source_location loc;

    public:
        Anomaly(
            std::string_view desc,
            const Data &data,
            const std::source_location &loc = std::source_location::current()
        ) : desc{desc}, user_data{data}, loc{loc}
        {}

        const std::string &what() const noexcept { return desc; }
        const std::source_location &where() const noexcept { return loc; }
        const Data& data() const noexcept { return user_data; }

        void handle_self (std::ostream &log_out) override;
    };

    template<class Data>
    Anomaly(std::string_view, const Data&) -> Anomaly<Data>;
    template<class Data>
    Anomaly(std::string_view, const Data &, std::source_location) -> Anomaly<Data>;

    /** @brief overload for stream out of std::source_location */
    inline std::ostream& operator<<(std::ostream& os, const std::source_location &loc){
        os << fmt::format("{}({}:{}), function `{}`",
                loc.file_name(), loc.line(), loc.column(), loc.function_name());
        return os;
    }

    /** @brief anomaly tag to mark a failed expect() statement */
    struct expectation_anomaly_tag{ using anomaly_tag = expectation_anomaly_tag; };

    /** @brief tag to mark general anomalies */
    struct general_anomaly_tag{ using anomaly_tag = general_anomaly_tag; };

    /** @brief anomaly tag to mark an anomaly that can be communicated as a warning */
    struct warning_anomaly_tag{ using anomaly_tag = warning_anomaly_tag; };

    /// @brief an enclosure was requested for a range with no points
    struct empty_point_set_tag { using anomaly_tag = empty_point_set_tag; };

    /// @brief a bounding region axis where lower > upper (or either bound is NaN)
    /// @tparam T the real value type of the bounds
    template<class T>
    struct inverted_axis_tag {
        using anomaly_tag = inverted_axis_tag<T>;
        int axis;
        T lower;
        T upper;
    };

    /**
     * @brief default way to handle an anomaly
     * log to output for every type of anomaly
     *
     * Override based on the data class to customize
     */
    template<class Data>
    void handle_anomaly(const Anomaly<Data> &anomaly, std::ostream &log_out) {
        log_out << "Error: " << anomaly.what() << std::endl
                << anomaly.where() << std::endl << std::endl;
    }

    template<>
    inline void handle_anomaly(const Anomaly<warning_anomaly_tag> &anomaly, std::ostream &log_out) {
        log_out << "Warning: " << anomaly.what() << std::endl
                << anomaly.where() << std::endl << std::endl;
    }

    template<>
    inline void handle_anomaly(const Anomaly<empty_point_set_tag> &anomaly, std::ostream &log_out) {
        log_out << "Warning: " << anomaly.what() << " (region left NaN seeded)" << std::endl
                << anomaly.where() << std::endl << std::endl;
    }

    template<class T>
    inline void handle_anomaly(const Anomaly<inverted_axis_tag<T>> &anomaly, std::ostream &log_out) {
        log_out << fmt::format("Inverted axis: {}\naxis {}: lower = {} is not <= upper = {}\n",
                anomaly.what(), anomaly.data().axis, anomaly.data().lower, anomaly.data().upper)
                << anomaly.where() << std::endl << std::endl;
    }

    template<class Data>
    void Anomaly<Data>::handle_self(std::ostream &log_out){
        handle_anomaly(*this, log_out);
    }

    /**
     * @brief singleton that collects anomalies until they are handled
     * anomalies still pending when the program exits are written to std::cerr
     */
    class AnomalyLog {
        private:
            std::vector<std::unique_ptr<AbstractAnomaly>> anomalies;
            AnomalyLog() = default;
            AnomalyLog(const AnomalyLog&) = delete;
            AnomalyLog& operator=(const AnomalyLog&) = delete;
        public:

            /**
             * @brief get the instance of this singleton
             */
            static AnomalyLog &instance() {
                static AnomalyLog instance_;
                return instance_;
            }

            template<class Data>
            static void log_anomaly(Anomaly<Data> anomaly){
                instance().anomalies.push_back(std::make_unique<Anomaly<Data>>(std::move(anomaly)));
            }

            static void log_anomaly(
                std::string_view message,
                std::source_location loc = std::source_location::current()
            ){
                AnomalyLog::log_anomaly(Anomaly{message, general_anomaly_tag{}, loc});
            }

            template<class Data>
            static void check(bool condition, Anomaly<Data> anomaly_on_failure){
                if(!condition) log_anomaly(std::move(anomaly_on_failure));
            }

            static void handle_anomalies(std::ostream &os = std::cerr){
                auto &pending = instance().anomalies;
                for(auto &anomaly : pending){
                    anomaly->handle_self(os);
                }
                pending.clear();
            }

            ~AnomalyLog(){
                // Log any remaining anommalies in the error stream
                for(auto &anomaly : anomalies){
                    anomaly->handle_self(std::cerr);
                }
                anomalies.clear();
            }

            static auto size() -> std::size_t
            { return instance().anomalies.size(); }
    };


    /**
     * @brief expect an expression to be true
     * if false creates an anomaly to express this and logs it
     * @param expect_true the expression that is expected to be true
     * @param message_if_false the message to describe the situation
     *                         if the expectation is not met
     */
    inline void expect(
        bool expect_true,
        std::string_view message_if_false,
        std::source_location loc = std::source_location::current()
    ){
        if(!expect_true){
            AnomalyLog::log_anomaly(Anomaly{message_if_false, expectation_anomaly_tag{}, loc});
        }
    }
}
