#pragma once

namespace gt::app
{

// Runs the gametime daemon: loads the calendar, resumes checkpointed
// schedules and drives the timers until SIGINT/SIGTERM. SIGHUP suspends and
// resumes every schedule in place.
int daemon_main(int argc, char *argv[]);

} // namespace gt::app
