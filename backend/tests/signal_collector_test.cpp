#include <gtest/gtest.h>
#include <string>
#include "signal_collector.h"
#include "test_helpers.h"

// ========================================================================
// Profundidad de loops
// ========================================================================

TEST(SignalCollectorTest, NestedLoopsFromFixture) {
    SignalProfile profile = profileOf(readFixture("nested_loops.py"), "foo");
    EXPECT_EQ(profile.maxLoopDepth, 2);
    EXPECT_EQ(profile.recursiveCallCount, 0);
    EXPECT_FALSE(profile.allocatesGrowingContainer);
    EXPECT_FALSE(profile.hasEarlyTermination);
}

TEST(SignalCollectorTest, SiblingLoopsDoNotStack) {
    std::string source =
        "def f(a, b):\n"
        "    for x in a:\n"
        "        pass\n"
        "    while b:\n"
        "        b.pop()\n"
        "    if a:\n"
        "        for y in b:\n"
        "            pass\n"
        "    else:\n"
        "        for z in a:\n"
        "            pass\n";
    EXPECT_EQ(profileOf(source, "f").maxLoopDepth, 1);
}

TEST(SignalCollectorTest, WhileInsideForInsideWith) {
    std::string source =
        "def f(rows):\n"
        "    with open('x') as fh:\n"
        "        for row in rows:\n"
        "            i = 0\n"
        "            while i < len(row):\n"
        "                for c in row[i]:\n"
        "                    i += 1\n";
    EXPECT_EQ(profileOf(source, "f").maxLoopDepth, 3);
}

TEST(SignalCollectorTest, LoopElseStaysAtEnclosingDepth) {
    std::string source =
        "def f(a):\n"
        "    for x in a:\n"
        "        pass\n"
        "    else:\n"
        "        for y in a:\n"
        "            pass\n";
    EXPECT_EQ(profileOf(source, "f").maxLoopDepth, 1);
}

TEST(SignalCollectorTest, ComprehensionsAreNotLoops) {
    std::string source =
        "def f(a, b):\n"
        "    pairs = [(x, y) for x in a for y in b]\n"
        "    return {k: v for k, v in pairs}\n";
    EXPECT_EQ(profileOf(source, "f").maxLoopDepth, 0);
}

TEST(SignalCollectorTest, AsyncForCountsAsLoop) {
    std::string source =
        "async def f(stream):\n"
        "    async for chunk in stream:\n"
        "        for b in chunk:\n"
        "            await consume(b)\n";
    EXPECT_EQ(profileOf(source, "f").maxLoopDepth, 2);
}

// ========================================================================
// Recursión
// ========================================================================

TEST(SignalCollectorTest, SingleAndDoubleSelfCalls) {
    SignalProfile countdown = profileOf(readFixture("countdown.py"), "countdown");
    EXPECT_EQ(countdown.recursiveCallCount, 1);
    EXPECT_EQ(countdown.recursiveCallLoopDepth, 0);

    SignalProfile fib = profileOf(readFixture("fibonacci.py"), "fib");
    EXPECT_EQ(fib.recursiveCallCount, 2);
    EXPECT_EQ(fib.maxLoopDepth, 0);
}

TEST(SignalCollectorTest, MethodRecursionThroughSelf) {
    std::string source = readFixture("graph_module.py");
    SignalProfile dfs = profileOf(source, "Graph.dfs");
    EXPECT_EQ(dfs.recursiveCallCount, 1);
    EXPECT_EQ(dfs.recursiveCallLoopDepth, 1);
    EXPECT_EQ(dfs.maxLoopDepth, 1);
}

TEST(SignalCollectorTest, MethodRecursionThroughClsAndClassName) {
    std::string source =
        "class Tree:\n"
        "    @classmethod\n"
        "    def build(cls, n):\n"
        "        return cls.build(n - 1)\n"
        "    @staticmethod\n"
        "    def size(node):\n"
        "        return Tree.size(node.left) + Tree.size(node.right)\n";
    EXPECT_EQ(profileOf(source, "Tree.build").recursiveCallCount, 1);
    EXPECT_EQ(profileOf(source, "Tree.size").recursiveCallCount, 2);
}

TEST(SignalCollectorTest, BareNameInsideMethodIsNotSelfCall) {
    std::string source =
        "def visit(x):\n"
        "    return x\n"
        "\n"
        "class Walker:\n"
        "    def visit(self, x):\n"
        "        return visit(x) + other.visit(x)\n";
    EXPECT_EQ(profileOf(source, "Walker.visit").recursiveCallCount, 0);
    EXPECT_EQ(profileOf(source, "visit").recursiveCallCount, 0);
}

TEST(SignalCollectorTest, AttributeCallWithSameNameIsNotRecursion) {
    std::string source =
        "def append(items, x):\n"
        "    items.append(x)\n";
    EXPECT_EQ(profileOf(source, "append").recursiveCallCount, 0);
}

TEST(SignalCollectorTest, CallsFromNestedScopesCount) {
    std::string source =
        "def visit(node):\n"
        "    def go(child):\n"
        "        visit(child)\n"
        "    for c in node.children:\n"
        "        go(c)\n"
        "    return sorted(node.children, key=lambda n: visit(n))\n";
    SignalProfile profile = profileOf(source, "visit");
    EXPECT_EQ(profile.recursiveCallCount, 2);
    EXPECT_EQ(profile.maxLoopDepth, 1);
}

TEST(SignalCollectorTest, ShadowingScopesHideRecursion) {
    std::string source =
        "def solve(n):\n"
        "    def helper(solve):\n"
        "        return solve(n)\n"
        "    apply = lambda solve: solve(1)\n"
        "    class solve_box:\n"
        "        pass\n"
        "    return helper(abs) + apply(abs)\n";
    EXPECT_EQ(profileOf(source, "solve").recursiveCallCount, 0);

    std::string redefined =
        "def walk(n):\n"
        "    for i in range(n):\n"
        "        def walk(m):\n"
        "            return walk(m - 1)\n";
    EXPECT_EQ(profileOf(redefined, "walk").recursiveCallCount, 0);
}

TEST(SignalCollectorTest, NestedFunctionProfilesItsOwnBody) {
    std::string source =
        "def outer(n):\n"
        "    def inner(k):\n"
        "        return inner(k - 1)\n"
        "    return inner(n)\n";
    EXPECT_EQ(profileOf(source, "outer.inner").recursiveCallCount, 1);
    EXPECT_EQ(profileOf(source, "outer").recursiveCallCount, 0);
}

// ========================================================================
// Contenedores que crecen
// ========================================================================

TEST(SignalCollectorTest, GrowthMethodsInsideLoops) {
    std::string source =
        "def collect(items):\n"
        "    out = []\n"
        "    out.append(0)\n"
        "    for x in items:\n"
        "        out.append(x)\n"
        "    return out\n";
    SignalProfile profile = profileOf(source, "collect");
    EXPECT_TRUE(profile.allocatesGrowingContainer);
    EXPECT_EQ(profile.growthLoopDepth, 1);
}

TEST(SignalCollectorTest, GrowthOutsideLoopsDoesNotCount) {
    std::string source =
        "def setup():\n"
        "    seen = set()\n"
        "    seen.add(1)\n"
        "    seen.update([2, 3])\n"
        "    return seen\n";
    SignalProfile profile = profileOf(source, "setup");
    EXPECT_FALSE(profile.allocatesGrowingContainer);
    EXPECT_EQ(profile.growthLoopDepth, 0);
}

TEST(SignalCollectorTest, MappingStoresCountButInPlaceWritesDoNot) {
    std::string source = readFixture("graph_module.py");
    SignalProfile groups = profileOf(source, "group_words");
    EXPECT_TRUE(groups.allocatesGrowingContainer);
    EXPECT_EQ(groups.growthLoopDepth, 1);

    std::string inPlace =
        "def double(arr):\n"
        "    for i in range(len(arr)):\n"
        "        arr[i] = arr[i] * 2\n"
        "        arr[i] += 1\n";
    EXPECT_FALSE(profileOf(inPlace, "double").allocatesGrowingContainer);
}

TEST(SignalCollectorTest, CounterAndDefaultdictUpdates) {
    std::string source =
        "from collections import Counter, defaultdict\n"
        "def tally(words):\n"
        "    counts = Counter()\n"
        "    index = defaultdict(list)\n"
        "    for i, w in enumerate(words):\n"
        "        counts[w] += 1\n"
        "        index[w] = i\n"
        "    return counts\n";
    SignalProfile profile = profileOf(source, "tally");
    EXPECT_TRUE(profile.allocatesGrowingContainer);
    EXPECT_EQ(profile.growthLoopDepth, 1);
}

TEST(SignalCollectorTest, AugmentedConcatenation) {
    std::string grows =
        "def flatten(rows):\n"
        "    result = []\n"
        "    for row in rows:\n"
        "        result += [x for x in row]\n";
    EXPECT_TRUE(profileOf(grows, "flatten").allocatesGrowingContainer);

    std::string sums =
        "def total(rows):\n"
        "    acc = 0\n"
        "    for row in rows:\n"
        "        acc += len(row)\n"
        "    return acc\n";
    EXPECT_FALSE(profileOf(sums, "total").allocatesGrowingContainer);
}

TEST(SignalCollectorTest, GrowthInsideNestedLoopsRecordsDepth) {
    std::string source =
        "def matrix(n):\n"
        "    grid = []\n"
        "    for i in range(n):\n"
        "        row = []\n"
        "        for j in range(n):\n"
        "            row.append(i * j)\n"
        "        grid.append(row)\n"
        "    return grid\n";
    SignalProfile profile = profileOf(source, "matrix");
    EXPECT_EQ(profile.maxLoopDepth, 2);
    EXPECT_EQ(profile.growthLoopDepth, 2);
}

// ========================================================================
// Terminación temprana
// ========================================================================

TEST(SignalCollectorTest, ConditionalReturnInsideLoop) {
    std::string source =
        "def contains(items, target):\n"
        "    for x in items:\n"
        "        if x == target:\n"
        "            return True\n"
        "    return False\n";
    EXPECT_TRUE(profileOf(source, "contains").hasEarlyTermination);
}

TEST(SignalCollectorTest, ConditionalBreakInsideWhile) {
    std::string source =
        "def scan(stream):\n"
        "    while True:\n"
        "        item = stream.read()\n"
        "        if not item:\n"
        "            break\n";
    EXPECT_TRUE(profileOf(source, "scan").hasEarlyTermination);
}

TEST(SignalCollectorTest, UnconditionalExitsAreNotEarlyTermination) {
    std::string source =
        "def first(items):\n"
        "    if not items:\n"
        "        return None\n"
        "    for x in items:\n"
        "        return x\n"
        "    while True:\n"
        "        break\n";
    EXPECT_FALSE(profileOf(source, "first").hasEarlyTermination);
}

// ========================================================================
// Operaciones conocidas
// ========================================================================

TEST(SignalCollectorTest, SelfCallOutsideLoopKeepsZeroCallDepth) {
    std::string source =
        "def f(n):\n"
        "    for i in range(n):\n"
        "        print(i)\n"
        "    return f(n - 1)\n";
    SignalProfile profile = profileOf(source, "f");
    EXPECT_EQ(profile.maxLoopDepth, 1);
    EXPECT_EQ(profile.recursiveCallCount, 1);
    EXPECT_EQ(profile.recursiveCallLoopDepth, 0);
}

TEST(SignalCollectorTest, BuiltinSortIsRecorded) {
    EXPECT_TRUE(profileOf("def f(a):\n    return sorted(a)\n", "f").hasBuiltinSort);
    EXPECT_TRUE(profileOf("def f(a):\n    a.sort(reverse=True)\n", "f").hasBuiltinSort);
    EXPECT_FALSE(profileOf("def f(a):\n    return a.sorted\n", "f").hasBuiltinSort);
}

TEST(SignalCollectorTest, BinarySearchPattern) {
    std::string source =
        "def search(items, target):\n"
        "    lo, hi = 0, len(items) - 1\n"
        "    while lo <= hi:\n"
        "        mid = (lo + hi) // 2\n"
        "        if items[mid] == target:\n"
        "            return mid\n"
        "        elif items[mid] < target:\n"
        "            lo = mid + 1\n"
        "        else:\n"
        "            hi = mid - 1\n"
        "    return -1\n";
    SignalProfile profile = profileOf(source, "search");
    EXPECT_TRUE(profile.hasBinarySearchPattern);
    EXPECT_TRUE(profile.hasEarlyTermination);
    EXPECT_EQ(profile.maxLoopDepth, 1);

    std::string linear =
        "def scan(items):\n"
        "    i = 0\n"
        "    while i < len(items):\n"
        "        i = i + 1\n";
    EXPECT_FALSE(profileOf(linear, "scan").hasBinarySearchPattern);
}

TEST(SignalCollectorTest, DividingLoop) {
    EXPECT_TRUE(profileOf("def f(n):\n    while n > 1:\n        n //= 2\n", "f").hasDividingLoop);
    EXPECT_TRUE(profileOf("def f(n):\n    while n:\n        n = n >> 1\n", "f").hasDividingLoop);
    EXPECT_FALSE(profileOf("def f(n):\n    while n:\n        n -= 1\n", "f").hasDividingLoop);
}

TEST(SignalCollectorTest, KnownOperationsDoNotChangeLoopDepth) {
    SignalProfile profile = profileOf("def f(n):\n    while n > 1:\n        n //= 2\n", "f");
    EXPECT_EQ(profile.maxLoopDepth, 1);
    EXPECT_FALSE(profile.allocatesGrowingContainer);
}

// ========================================================================
// Script
// ========================================================================

TEST(SignalCollectorTest, MainPseudoFunction) {
    SignalProfile profile = profileOf(readFixture("script.py"), "<main>");
    EXPECT_EQ(profile.maxLoopDepth, 2);
    EXPECT_EQ(profile.recursiveCallCount, 0);
    EXPECT_FALSE(profile.allocatesGrowingContainer);
}

TEST(SignalCollectorTest, CollectionIsDeterministic) {
    std::string source = readFixture("graph_module.py");
    FunctionExtractor extractor;
    ExtractionResult result = extractor.extract(source);
    SignalCollector collector;
    for (const auto& unit : result.functions) {
        SignalProfile a = collector.collect(unit);
        SignalProfile b = collector.collect(unit);
        EXPECT_EQ(a.maxLoopDepth, b.maxLoopDepth) << unit.name;
        EXPECT_EQ(a.recursiveCallCount, b.recursiveCallCount) << unit.name;
        EXPECT_EQ(a.allocatesGrowingContainer, b.allocatesGrowingContainer) << unit.name;
        EXPECT_EQ(a.hasEarlyTermination, b.hasEarlyTermination) << unit.name;
    }
}
