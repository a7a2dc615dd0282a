#include <acpbridge/types.hpp>

namespace acpbridge
{

const char* to_string(RuntimeState state)
{
    switch (state)
    {
    case RuntimeState::Idle:
        return "IDLE";
    case RuntimeState::Starting:
        return "STARTING";
    case RuntimeState::Ready:
        return "READY";
    case RuntimeState::Prompting:
        return "PROMPTING";
    case RuntimeState::Error:
        return "ERROR";
    case RuntimeState::ShuttingDown:
        return "SHUTTING_DOWN";
    }
    return "UNKNOWN";
}

const char* to_string(TerminationOutcome outcome)
{
    switch (outcome)
    {
    case TerminationOutcome::Exit:
        return "exit";
    case TerminationOutcome::AlreadyExited:
        return "already-exited";
    case TerminationOutcome::SigKill:
        return "sigkill";
    }
    return "unknown";
}

} // namespace acpbridge
