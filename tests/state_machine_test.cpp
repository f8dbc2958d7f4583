#include <gtest/gtest.h>
#include <Marginalia/Errors.hpp>
#include <Marginalia/HighlightManagerStateMachine.hpp>
#include <Marginalia/SuggestionStateMachine.hpp>

using namespace Marginalia;

namespace {

SuggestionHighlight one(){
    SuggestionHighlight s;
    s.id = "s1";
    s.range = Range(0, 3);
    return s;
}

} // namespace

TEST(SuggestionStateMachineTest, PendingOnlyAcceptsReviewCompleteAndDismiss) {
    for(SuggestionEvent e : allSuggestionEvents()){
        SuggestionState next = suggestionTransition(SuggestionState::Pending, e);
        if(e == SuggestionEvent::ReviewComplete) EXPECT_EQ(next, SuggestionState::Ready);
        else if(e == SuggestionEvent::UserDismisses) EXPECT_EQ(next, SuggestionState::Dismissed);
        else EXPECT_EQ(next, SuggestionState::Pending) << toString(e);
    }
}

TEST(SuggestionStateMachineTest, TerminalStatesAcceptNothing) {
    for(SuggestionState s : {SuggestionState::Invalidated, SuggestionState::Completed, SuggestionState::Dismissed}){
        EXPECT_TRUE(isTerminalState(s));
        EXPECT_TRUE(getValidEvents(s).empty());
        for(SuggestionEvent e : allSuggestionEvents()) EXPECT_EQ(suggestionTransition(s, e), s);
    }
    EXPECT_FALSE(isTerminalState(SuggestionState::Accepted));
}

TEST(SuggestionStateMachineTest, HappyPathToCompleted) {
    SuggestionState s = SuggestionState::Pending;
    for(SuggestionEvent e : {SuggestionEvent::ReviewComplete, SuggestionEvent::UserActivates,
                             SuggestionEvent::UserAccepts, SuggestionEvent::TextApplied}){
        ASSERT_TRUE(canTransition(s, e));
        s = suggestionTransition(s, e);
    }
    EXPECT_EQ(s, SuggestionState::Completed);
}

TEST(SuggestionStateMachineTest, ValidateTransitionThrows) {
    EXPECT_NO_THROW(validateTransition(SuggestionState::Ready, SuggestionEvent::UserActivates));
    try{
        validateTransition(SuggestionState::Ready, SuggestionEvent::TextApplied);
        FAIL() << "expected StateTransitionError";
    } catch(const StateTransitionError& e){
        EXPECT_EQ(std::string(e.what()), "Invalid state transition: cannot apply TEXT_APPLIED from READY");
        EXPECT_EQ(e.currentState(), "READY");
        EXPECT_EQ(e.event(), "TEXT_APPLIED");
        EXPECT_FALSE(e.recoverable());
    }
}

TEST(SuggestionStateMachineTest, TrackedStateHelpers) {
    auto a = createSuggestionState("a");
    auto b = createSuggestionState("b");
    EXPECT_EQ(a.state, SuggestionState::Pending);

    auto same = applySuggestionTransition(a, SuggestionEvent::TextApplied);
    EXPECT_TRUE(same == a);

    auto ready = batchTransition({a, b}, SuggestionEvent::ReviewComplete);
    ASSERT_EQ(ready.size(), 2u);
    EXPECT_EQ(ready[0].state, SuggestionState::Ready);
    ASSERT_TRUE(ready[0].previousState.has_value());
    EXPECT_EQ(*ready[0].previousState, SuggestionState::Pending);

    ready[1] = applySuggestionTransition(ready[1], SuggestionEvent::UserDismisses);
    EXPECT_EQ(filterByState(ready, {SuggestionState::Dismissed}).size(), 1u);
    auto counts = countByState(ready);
    EXPECT_EQ(counts[SuggestionState::Ready], 1);
    EXPECT_EQ(counts[SuggestionState::Dismissed], 1);
    EXPECT_TRUE(isActiveState(SuggestionState::Adjusted));
    EXPECT_FALSE(getStateDescription(SuggestionState::Adjusted).empty());
}

TEST(HighlightManagerTest, ReviewLifecycle) {
    auto r = highlightManagerTransition(ManagerState::Idle, ManagerEvent::requestReview());
    EXPECT_EQ(r.state, ManagerState::Reviewing);
    ASSERT_EQ(r.sideEffects.size(), 1u);
    EXPECT_EQ(r.sideEffects[0].type, SideEffectType::StartReview);

    EXPECT_EQ(getNextState(ManagerState::Reviewing, ManagerEvent::reviewComplete({})), ManagerState::Idle);
    EXPECT_EQ(getNextState(ManagerState::Reviewing, ManagerEvent::reviewComplete({one()})), ManagerState::HasSuggestions);

    auto accept = highlightManagerTransition(ManagerState::HasSuggestions, ManagerEvent::acceptSuggestion("s1"));
    EXPECT_EQ(accept.state, ManagerState::Applying);
    ASSERT_EQ(accept.sideEffects.size(), 1u);
    EXPECT_EQ(accept.sideEffects[0].type, SideEffectType::ApplySuggestion);
    EXPECT_EQ(accept.sideEffects[0].id, "s1");

    EXPECT_EQ(getNextState(ManagerState::Applying, ManagerEvent::applyComplete(2)), ManagerState::HasSuggestions);
    EXPECT_EQ(getNextState(ManagerState::Applying, ManagerEvent::applyComplete(0)), ManagerState::Idle);
}

TEST(HighlightManagerTest, RequestReviewWithSuggestionsClearsFirst) {
    auto r = highlightManagerTransition(ManagerState::HasSuggestions, ManagerEvent::requestReview());
    EXPECT_EQ(r.state, ManagerState::Reviewing);
    ASSERT_EQ(r.sideEffects.size(), 2u);
    EXPECT_EQ(r.sideEffects[0].type, SideEffectType::ClearAllSuggestions);
    EXPECT_EQ(r.sideEffects[1].type, SideEffectType::StartReview);
}

TEST(HighlightManagerTest, TextChangedCarriesEdit) {
    auto r = highlightManagerTransition(ManagerState::HasSuggestions, ManagerEvent::textChanged(4, 2, 7));
    EXPECT_EQ(r.state, ManagerState::HasSuggestions);
    ASSERT_EQ(r.sideEffects.size(), 1u);
    EXPECT_EQ(r.sideEffects[0].type, SideEffectType::UpdatePositions);
    EXPECT_EQ(r.sideEffects[0].editStart, 4);
    EXPECT_EQ(r.sideEffects[0].deleteCount, 2);
    EXPECT_EQ(r.sideEffects[0].insertLength, 7);
}

TEST(HighlightManagerTest, UndefinedPairsAreNoOps) {
    auto r = highlightManagerTransition(ManagerState::Idle, ManagerEvent::acceptSuggestion("x"));
    EXPECT_EQ(r.state, ManagerState::Idle);
    EXPECT_TRUE(r.sideEffects.empty());
    EXPECT_FALSE(canTransition(ManagerState::Applying, ManagerEventType::RequestReview));
    EXPECT_THROW(validateTransition(ManagerState::Applying, ManagerEventType::RequestReview), StateTransitionError);
}

TEST(HighlightManagerTest, FailureAndRecovery) {
    auto failed = highlightManagerTransition(ManagerState::Applying, ManagerEvent::reviewFailed("boom"));
    EXPECT_EQ(failed.state, ManagerState::Error);
    ASSERT_EQ(failed.sideEffects.size(), 1u);
    EXPECT_EQ(failed.sideEffects[0].type, SideEffectType::LogError);
    EXPECT_EQ(failed.sideEffects[0].error, "boom");

    EXPECT_EQ(getNextState(ManagerState::Error, ManagerEvent::recover()), ManagerState::Idle);
    EXPECT_EQ(getNextState(ManagerState::Reviewing, ManagerEvent::clearAll()), ManagerState::Idle);
}

TEST(HighlightManagerTest, ContextTracksErrors) {
    auto ctx = createInitialContext();
    ctx = applyTransitionToContext(ctx, ManagerEvent::requestReview());
    EXPECT_TRUE(ctx.isProcessing);
    ctx = applyTransitionToContext(ctx, ManagerEvent::reviewFailed("network"));
    EXPECT_EQ(ctx.state, ManagerState::Error);
    ASSERT_TRUE(ctx.errorMessage.has_value());
    EXPECT_EQ(*ctx.errorMessage, "network");
    ctx = applyTransitionToContext(ctx, ManagerEvent::recover());
    EXPECT_EQ(ctx.state, ManagerState::Idle);
    EXPECT_FALSE(ctx.errorMessage.has_value());
    EXPECT_FALSE(ctx.isProcessing);
}

TEST(HighlightManagerTest, Predicates) {
    EXPECT_TRUE(canInteractWithSuggestions(ManagerState::HasSuggestions));
    EXPECT_FALSE(canInteractWithSuggestions(ManagerState::Applying));
    EXPECT_TRUE(canStartReview(ManagerState::Idle));
    EXPECT_TRUE(isBusy(ManagerState::Reviewing));
    EXPECT_TRUE(isError(ManagerState::Error));
    ASSERT_TRUE(parseManagerState("HAS_SUGGESTIONS").has_value());
    EXPECT_EQ(*parseManagerState("HAS_SUGGESTIONS"), ManagerState::HasSuggestions);
    EXPECT_FALSE(parseManagerState("nope").has_value());
}
