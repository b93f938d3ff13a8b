#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include <utcnow.hpp>

using namespace utcnow;

// Helper function to print a normalized value or the error it produced
void printResult(const Result<CanonicalString>& result, const std::string& label) {
    std::cout << label << ":\n";
    if (result) {
        std::cout << "  " << result->str() << "\n";
    } else {
        std::cout << "  error: " << result.error().describe() << "\n";
    }
    std::cout << std::endl;
}

// Helper function to print the parts of an instant
void printInstant(const Instant& instant, const std::string& label) {
    std::cout << label << ":\n";
    std::cout << "  Seconds: " << instant.seconds() << "\n";
    std::cout << "  Microseconds: " << instant.microseconds() << "\n";

    auto dt = DateTime::from_instant(instant);
    std::cout << "  UTC time: " << dt.year << "-" << std::setfill('0') << std::setw(2)
              << dt.month << "-" << std::setw(2) << dt.day << " " << std::setw(2) << dt.hour
              << ":" << std::setw(2) << dt.minute << ":" << std::setw(2) << dt.second << "."
              << std::setw(6) << dt.microsecond << " UTC\n";
    std::cout << std::setfill(' ') << std::endl;
}

int main() {
    std::cout << "utcnow Examples\n";
    std::cout << "===============\n\n";

    // Example 1: Normalizing inputs
    std::cout << "1. Normalizing Inputs\n";
    std::cout << "---------------------\n";

    printResult(rfc3339_timestamp(), "Current time");
    printResult(rfc3339_timestamp("1996-12-19T16:39:57-08:00"), "RFC 3339 with offset");
    printResult(rfc3339_timestamp("2023-09-07 02:18"), "Loose date and time");
    printResult(rfc3339_timestamp(1693005993.285967), "Epoch seconds as a number");
    printResult(rfc3339_timestamp("-1000.553999"), "Epoch seconds as text");
    printResult(rfc3339_timestamp(std::chrono::system_clock::now()),
                "From std::chrono::system_clock");

    // Example 2: Invalid values are reported, never coerced
    std::cout << "2. Errors\n";
    std::cout << "---------\n";

    printResult(rfc3339_timestamp("2021-02-30"), "Impossible date");
    printResult(rfc3339_timestamp("2021-02-18T10:00:00+25:00"), "Impossible offset");
    printResult(rfc3339_timestamp("yesterday"), "Not a timestamp");

    // Example 3: Modifiers and differences
    std::cout << "3. Modifiers and Differences\n";
    std::cout << "----------------------------\n";

    printResult(rfc3339_timestamp("2023-09-07T02:18:00Z", "+7d"), "Base + 7 days");
    printResult(rfc3339_timestamp("2023-09-07T02:18:00Z", -90), "Base - 90 seconds");

    auto hours = timediff("2022-01-01T00:00:00Z", "2022-01-02T06:00:00Z", "hours");
    if (hours) {
        std::cout << "Difference between 2022-01-01 and 2022-01-02 06:00: " << *hours
                  << " hours\n\n";
    }

    // Example 4: Other representations
    std::cout << "4. Other Representations\n";
    std::cout << "------------------------\n";

    const char* value = "2022-12-06T12:32:04.170660Z";
    auto epoch = as_unixtime(value);
    auto msg = as_message(value);
    auto day = as_date_string(value, "+12:00");
    if (epoch && msg && day) {
        std::cout << "Value: " << value << "\n";
        std::cout << "  Unixtime: " << std::setprecision(17) << *epoch << "\n";
        std::cout << "  Message: " << msg->describe() << "\n";
        std::cout << "  Date at +12:00: " << *day << "\n\n";
    }

    // Example 5: Freezing the clock
    std::cout << "5. Freezing the Clock\n";
    std::cout << "---------------------\n";

    Synchronizer sync;
    Converter convert(sync);
    {
        auto frame = sync.frame();
        auto frozen = frame.enter();
        if (!frozen) {
            std::cout << "  error: " << frozen.error().describe() << "\n";
            return 1;
        }
        printInstant(*frozen, "Frozen now");

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        printResult(convert.rfc3339_timestamp(), "Now, 20 milliseconds later");
        printResult(convert.rfc3339_timestamp("+1h"), "One hour from the frozen now");
    }
    std::cout << "Frame exited, clock is live again: " << (sync.active() ? "no" : "yes")
              << "\n\n";

    // Example 6: A newer frame supersedes an older one
    std::cout << "6. Superseded Frames\n";
    std::cout << "--------------------\n";

    auto first = sync.frame("2000-01-01");
    auto second = sync.frame("2010-01-01");
    (void)first.enter();
    (void)second.enter();
    std::cout << "First frame: " << frame_state_string(first.state()) << "\n";
    std::cout << "Second frame: " << frame_state_string(second.state()) << "\n";

    auto stale = first.rfc3339();
    std::cout << "Reading the first frame: "
              << (stale ? stale->str() : stale.error().describe()) << "\n";

    return 0;
}
