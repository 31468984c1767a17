#include <gtest/gtest.h>
#include "heuristic_classifier.h"

class HeuristicClassifierTest : public ::testing::Test {
protected:
    HeuristicClassifier classifier;

    static SignalProfile loops(int depth) {
        SignalProfile profile;
        profile.maxLoopDepth = depth;
        return profile;
    }

    static SignalProfile recursion(int calls, int depth = 0) {
        SignalProfile profile;
        profile.recursiveCallCount = calls;
        profile.maxLoopDepth = depth;
        return profile;
    }
};

// ========================================================================
// Tabla de tiempo
// ========================================================================

TEST_F(HeuristicClassifierTest, LoopDepthTable) {
    EXPECT_EQ(classifier.evaluate(loops(0)).timeClass, ComplexityClass::Constant);
    EXPECT_EQ(classifier.evaluate(loops(1)).timeClass, ComplexityClass::Linear);
    EXPECT_EQ(classifier.evaluate(loops(2)).timeClass, ComplexityClass::Quadratic);
    EXPECT_EQ(classifier.evaluate(loops(3)).timeClass, ComplexityClass::Cubic);
}

TEST_F(HeuristicClassifierTest, DeepNestingIsUnknownNotMistagged) {
    EXPECT_EQ(classifier.evaluate(loops(4)).timeClass, ComplexityClass::Unknown);
    EXPECT_EQ(classifier.evaluate(loops(7)).timeClass, ComplexityClass::Unknown);
}

TEST_F(HeuristicClassifierTest, SingleRecursionCompoundsWithEnclosingLoops) {
    EXPECT_EQ(classifier.evaluate(recursion(1, 0)).timeClass, ComplexityClass::Linear);

    SignalProfile profile = recursion(1, 1);
    profile.recursiveCallLoopDepth = 1;
    EXPECT_EQ(classifier.evaluate(profile).timeClass, ComplexityClass::Quadratic);

    profile = recursion(1, 2);
    profile.recursiveCallLoopDepth = 2;
    EXPECT_EQ(classifier.evaluate(profile).timeClass, ComplexityClass::Cubic);

    profile = recursion(1, 3);
    profile.recursiveCallLoopDepth = 3;
    EXPECT_EQ(classifier.evaluate(profile).timeClass, ComplexityClass::Unknown);
}

TEST_F(HeuristicClassifierTest, SiblingLoopDoesNotMultiplySelfCall) {
    // Autollamada fuera del loop: max(recursión, loops), no el producto
    EXPECT_EQ(classifier.evaluate(recursion(1, 1)).timeClass, ComplexityClass::Linear);
    EXPECT_EQ(classifier.evaluate(recursion(1, 2)).timeClass, ComplexityClass::Quadratic);
    EXPECT_EQ(classifier.evaluate(recursion(1, 3)).timeClass, ComplexityClass::Cubic);
    EXPECT_EQ(classifier.evaluate(recursion(1, 4)).timeClass, ComplexityClass::Unknown);

    // La autollamada dentro de un loop, con otro loop más profundo al lado
    SignalProfile profile = recursion(1, 3);
    profile.recursiveCallLoopDepth = 1;
    EXPECT_EQ(classifier.evaluate(profile).timeClass, ComplexityClass::Cubic);
}

TEST_F(HeuristicClassifierTest, BranchingRecursionIsExponential) {
    EXPECT_EQ(classifier.evaluate(recursion(2)).timeClass, ComplexityClass::Exponential);
    EXPECT_EQ(classifier.evaluate(recursion(3, 2)).timeClass, ComplexityClass::Exponential);
}

TEST_F(HeuristicClassifierTest, EarlyTerminationDoesNotLowerTheBound) {
    SignalProfile profile = loops(1);
    profile.hasEarlyTermination = true;
    EXPECT_EQ(classifier.evaluate(profile).timeClass, ComplexityClass::Linear);
}

// ========================================================================
// Tabla de espacio
// ========================================================================

TEST_F(HeuristicClassifierTest, SpaceRules) {
    EXPECT_EQ(classifier.evaluate(loops(3)).spaceClass, ComplexityClass::Constant);
    EXPECT_EQ(classifier.evaluate(recursion(1)).spaceClass, ComplexityClass::Linear);
    EXPECT_EQ(classifier.evaluate(recursion(2)).spaceClass, ComplexityClass::Linear);

    SignalProfile grows = loops(2);
    grows.allocatesGrowingContainer = true;
    grows.growthLoopDepth = 1;
    EXPECT_EQ(classifier.evaluate(grows).spaceClass, ComplexityClass::Linear);

    grows.growthLoopDepth = 2;
    EXPECT_EQ(classifier.evaluate(grows).spaceClass, ComplexityClass::Quadratic);
}

TEST_F(HeuristicClassifierTest, GrowthWithoutRecordedDepthCountsAsLinear) {
    SignalProfile profile = loops(2);
    profile.allocatesGrowingContainer = true;
    EXPECT_EQ(classifier.evaluate(profile).spaceClass, ComplexityClass::Linear);
}

TEST_F(HeuristicClassifierTest, SpaceNeverExceedsQuadratic) {
    for (int depth = 0; depth <= 6; ++depth) {
        for (int calls = 0; calls <= 3; ++calls) {
            SignalProfile profile = recursion(calls, depth);
            profile.allocatesGrowingContainer = depth > 0;
            profile.growthLoopDepth = depth;
            EXPECT_TRUE(isValidSpaceClass(classifier.evaluate(profile).spaceClass))
                << "depth=" << depth << " calls=" << calls;
        }
    }
}

// ========================================================================
// Perfiles contradictorios
// ========================================================================

TEST_F(HeuristicClassifierTest, MalformedProfilesYieldUnknown) {
    SignalProfile growthWithoutLoop;
    growthWithoutLoop.allocatesGrowingContainer = true;

    SignalProfile growthTooDeep = loops(1);
    growthTooDeep.allocatesGrowingContainer = true;
    growthTooDeep.growthLoopDepth = 2;

    SignalProfile depthWithoutFlag = loops(2);
    depthWithoutFlag.growthLoopDepth = 1;

    SignalProfile selfCallTooDeep = recursion(1, 1);
    selfCallTooDeep.recursiveCallLoopDepth = 2;

    SignalProfile negative = loops(-1);

    const SignalProfile cases[] = {growthWithoutLoop, growthTooDeep, depthWithoutFlag, selfCallTooDeep, negative};
    for (const SignalProfile& profile : cases) {
        ComplexityVerdict verdict = classifier.evaluate(profile);
        EXPECT_EQ(verdict.timeClass, ComplexityClass::Unknown);
        EXPECT_EQ(verdict.spaceClass, ComplexityClass::Unknown);
    }
}

// ========================================================================
// Contrato del clasificador
// ========================================================================

TEST_F(HeuristicClassifierTest, VerdictCopiesCountsAndSource) {
    SignalProfile profile = recursion(2, 3);
    ComplexityVerdict verdict = classifier.evaluate(profile);
    EXPECT_EQ(verdict.loopCount, 3);
    EXPECT_EQ(verdict.recursionCount, 2);
    EXPECT_EQ(verdict.source, VerdictSource::Heuristic);
}

TEST_F(HeuristicClassifierTest, ClassifyAlwaysSucceeds) {
    FunctionUnit unit;
    unit.name = "f";
    SignalProfile malformed;
    malformed.allocatesGrowingContainer = true;

    ClassifyResult result = classifier.classify(unit, malformed);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.failure, ClassifyFailure::None);
    EXPECT_EQ(result.verdict.timeClass, ComplexityClass::Unknown);
}
