#pragma once

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace unit_test
{
    // Streamed into by the ASSERT macros. Reports the failed statement with
    // whatever extra context was streamed, then ends the test run.
    class TestFailure: public std::stringstream
    {
    public:
        TestFailure(const char* filename, unsigned int linenumber, const char* statement):
            m_filename(filename), m_linenumber(linenumber), m_statement(statement) {}
        ~TestFailure()
        {
            std::cout << m_filename << ":" << m_linenumber << ": error: \"" << m_statement << "\" was false.\n";
            if (!str().empty())
                std::cout << "    " << str() << "\n";
            std::cout.flush();
            std::exit(1);
        }

    private:
        const char* m_filename;
        unsigned int m_linenumber;
        const char* m_statement;
    };
}

#define ASSERT_TRUE(...) if (!!(__VA_ARGS__)) {} else unit_test::TestFailure(__FILE__, __LINE__, #__VA_ARGS__)
#define ASSERT_EQ(a, b) if ((a) == (b)) {} else unit_test::TestFailure(__FILE__, __LINE__, #a " == " #b) << (a) << " != " << (b) << ' '
