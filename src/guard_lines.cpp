#include "guard.hpp"

namespace {

const char* const SEE_LINES[] = {
    "WHO GOES THERE?",
    "HUH?",
    "WHAT?",
    "WAIT...",
    "WHO'S THAT?",
    "HEY...",
    "HMM...",
    "WHAT MOVED?",
    "DID THAT SHADOW MOVE?",
    "I SEE SOMETHING...",
    "HELLO?",
};

const char* const SEE_DISGUISED_LINES[] = {
    "WHO ARE YOU?",
    "YOU DON'T LOOK FAMILIAR!",
    "DO I KNOW YOU?",
    "WAIT...",
    "HEY...",
    "LET ME SEE YOUR FACE...",
    "DO YOU BELONG HERE?",
    "YOU ARE...?",
    "ARE YOU NEW HERE?",
};

const char* const HEAR_LINES[] = {
    "HUH?",
    "WHAT?",
    "HARK!",
    "A NOISE...",
    "I HEARD SOMETHING.",
    "HMM...",
    "WHO GOES THERE?",
    "WHAT'S THAT NOISE?",
    "I HEAR SOMETHING...",
    "HELLO?",
};

const char* const HEAR_GUARD_LINES[] = {
    "WHERE?",
    "I'M COMING!",
    "HERE I COME!",
    "TO ARMS!",
    "WHERE IS HE?",
};

const char* const CHASE_LINES[] = {
    "HALT!",
    "HEY!",
    "AHA!",
    "I SEE YOU!",
    "I'M COMING!",
    "I'LL GET YOU!",
    "JUST YOU WAIT...",
    "YOU WON'T GET AWAY!",
    "OH NO YOU DON'T...",
    "GET HIM!",
    "AFTER HIM!",
    "THIEF!",
};

const char* const INVESTIGATE_LINES[] = {
    "THAT NOISE AGAIN...",
    "I HEARD IT AGAIN!",
    "SOMEONE'S THERE!",
    "WHO COULD THAT BE?",
    "THERE IT IS AGAIN!",
    "WHAT WAS THAT?",
    "BETTER CHECK IT OUT...",
    "WHAT KEEPS MAKING THOSE NOISES?",
    "THAT BETTER BE RATS!",
    "AGAIN?",
};

const char* const END_CHASE_LINES[] = {
    "(HUFF, HUFF)",
    "WHERE DID HE GO?",
    "LOST HIM!",
    "GONE!",
    "COME BACK!",
    "ARGH!",
    "HE'S NOT COMING BACK.",
    "BLAST!",
    "NEXT TIME!",
};

const char* const END_INVESTIGATION_LINES[] = {
    "GUESS IT WAS NOTHING.",
    "WONDER WHAT IT WAS?",
    "BETTER GET BACK.",
    "IT'S QUIET NOW.",
    "THIS IS WHERE I HEARD IT...",
    "NOTHING, NOW.",
};

const char* const DONE_LOOKING_LINES[] = {
    "MUST HAVE BEEN RATS.",
    "TOO MUCH COFFEE!",
    "I'VE GOT THE JITTERS.",
    "PROBABLY NOTHING.",
    "I THOUGHT I SAW SOMETHING.",
    "OH WELL.",
    "NOTHING.",
    "CAN'T SEE IT NOW.",
    "I'VE BEEN UP TOO LONG.",
    "SEEING THINGS, I GUESS.",
    "HOPE IT WASN'T ANYTHING.",
    "DID I IMAGINE THAT?",
};

const char* const DONE_SEEING_DISGUISED_LINES[] = {
    "WHO WAS THAT?",
    "HUH...",
    "I WONDER WHO THAT WAS?",
    "OH WELL.",
    "I'M SEEING THINGS.",
    "I'VE BEEN UP TOO LONG.",
    "SEEING THINGS, I GUESS.",
    "PROBABLY NEW HERE.",
    "BETTER GET BACK TO IT.",
    "DID I IMAGINE THAT?",
    "SHOULD I TELL THE BOSS?",
};

const char* const DONE_LISTENING_LINES[] = {
    "MUST HAVE BEEN RATS.",
    "TOO MUCH COFFEE!",
    "I'VE GOT THE JITTERS.",
    "PROBABLY NOTHING.",
    "I THOUGHT I HEARD SOMETHING.",
    "OH WELL.",
    "NOTHING.",
    "CAN'T HEAR IT NOW.",
    "I'VE BEEN UP TOO LONG.",
    "HEARING THINGS, I GUESS.",
    "HOPE IT WASN'T ANYTHING.",
    "DID I IMAGINE THAT?",
};

const char* const DAMAGE_LINES[] = {
    "OOF!",
    "KRAK!",
    "POW!",
    "URK!",
    "SMACK!",
    "BIF!",
};

template <size_t N>
LineIter pool(const char* const (&lines)[N]) {
    LineIter it;
    it.lines = lines;
    it.count = N;
    return it;
}

} // namespace

const char* LineIter::next() {
    if (count == 0) return "";
    const char* s = lines[index];
    index = (index + 1) % count;
    return s;
}

GuardLines::GuardLines()
    : see(pool(SEE_LINES)),
      seeDisguised(pool(SEE_DISGUISED_LINES)),
      hear(pool(HEAR_LINES)),
      hearGuard(pool(HEAR_GUARD_LINES)),
      chase(pool(CHASE_LINES)),
      investigate(pool(INVESTIGATE_LINES)),
      endChase(pool(END_CHASE_LINES)),
      endInvestigation(pool(END_INVESTIGATION_LINES)),
      doneLooking(pool(DONE_LOOKING_LINES)),
      doneSeeingDisguised(pool(DONE_SEEING_DISGUISED_LINES)),
      doneListening(pool(DONE_LISTENING_LINES)),
      damage(pool(DAMAGE_LINES)) {}

LineIter* linesForStateChange(GuardLines& lines, GuardMode prev, GuardMode next) {
    if (prev == next) return nullptr;

    switch (next) {
        case GuardMode::Patrol:
            switch (prev) {
                case GuardMode::Look: return &lines.doneLooking;
                case GuardMode::LookAtDisguised: return &lines.doneSeeingDisguised;
                case GuardMode::Listen: return &lines.doneListening;
                case GuardMode::MoveToLastSound:
                case GuardMode::MoveToGuardShout: return &lines.endInvestigation;
                case GuardMode::MoveToLastSighting: return &lines.endChase;
                default: return nullptr;
            }
        case GuardMode::Look: return &lines.see;
        case GuardMode::LookAtDisguised: return &lines.seeDisguised;
        case GuardMode::Listen: return &lines.hear;
        // Picking the trail back up is silent.
        case GuardMode::ChaseVisibleTarget:
            return (prev != GuardMode::MoveToLastSighting) ? &lines.chase : nullptr;
        case GuardMode::MoveToLastSighting: return nullptr;
        case GuardMode::MoveToLastSound: return &lines.investigate;
        case GuardMode::MoveToGuardShout: return &lines.hearGuard;
    }
    return nullptr;
}
