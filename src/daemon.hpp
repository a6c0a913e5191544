#pragma once

// Detaches from the terminal: double fork, new session, umask 0, stdio on
// /dev/null. Returns only in the final child; false if a step failed.
bool daemonize_process();
