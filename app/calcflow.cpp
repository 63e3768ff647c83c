/**
 * @file       calcflow.cpp
 * @brief      Entry point of the calcflow command line tool
 * @date       2026-10-18
 */

#include "CalcflowApp.hpp"

/**
 * @brief       Parses the command line and runs the requested command
 * @param[in]   argc
 * @param[in]   argv
 * @return      A @ref int exit code
 */
int main( int argc, char **argv )
{
    CalcflowApp app;

    auto code = app.init( argc, argv );
    if ( code != 0 )
    {
        return code;
    }
    return app.run();
}
