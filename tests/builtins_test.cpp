#include <gtest/gtest.h>

#include "run_helpers.hpp"

using mathguard::testing::Eval;
using mathguard::testing::EvalError;

TEST(BuiltinsTest, Aggregates) {
    EXPECT_EQ(Eval("len([1, 2, 3])"), "3");
    EXPECT_EQ(Eval("sum([1, 2, 3], 10)"), "16");
    EXPECT_EQ(Eval("sum([0.5, 0.25])"), "0.75");
    EXPECT_EQ(Eval("min(3, 1, 2)"), "1");
    EXPECT_EQ(Eval("max(['aa', 'b', 'ccc'], key=len)"), "'ccc'");
    EXPECT_EQ(Eval("max([], default=-1)"), "-1");
    EXPECT_EQ(Eval("all([1, True, 'x'])"), "True");
    EXPECT_EQ(Eval("any([0, '', None])"), "False");
    EXPECT_EQ(EvalError("min([])"), "ValueError: min() iterable argument is empty");
}

TEST(BuiltinsTest, Iteration) {
    EXPECT_EQ(Eval("list(range(2, 10, 3))"), "[2, 5, 8]");
    EXPECT_EQ(Eval("list(enumerate('ab', 1))"), "[(1, 'a'), (2, 'b')]");
    EXPECT_EQ(Eval("list(zip([1, 2, 3], 'xy'))"), "[(1, 'x'), (2, 'y')]");
    EXPECT_EQ(Eval("list(map(lambda a, b: a * b, [1, 2], [3, 4]))"), "[3, 8]");
    EXPECT_EQ(Eval("list(filter(None, [0, 1, 2, 0]))"), "[1, 2]");
    EXPECT_EQ(Eval("list(reversed(range(3)))"), "[2, 1, 0]");
    EXPECT_EQ(Eval("sorted([3, 1, 2], reverse=True)"), "[3, 2, 1]");
    EXPECT_EQ(Eval("sorted(['b', 'A', 'c'], key=lambda s: s.lower())"), "['A', 'b', 'c']");
    EXPECT_EQ(Eval("str(range(10)[2:5])"), "'range(2, 5)'");
    EXPECT_EQ(Eval("len(range(0, 100, 7))"), "15");
}

TEST(BuiltinsTest, Conversions) {
    EXPECT_EQ(Eval("int('  42 ')"), "42");
    EXPECT_EQ(Eval("int('ff', 16)"), "255");
    EXPECT_EQ(Eval("int(-3.9)"), "-3");
    EXPECT_EQ(Eval("float('1e3')"), "1000.0");
    EXPECT_EQ(Eval("float('inf')"), "inf");
    EXPECT_EQ(Eval("str(1.0)"), "'1.0'");
    EXPECT_EQ(Eval("bool([])"), "False");
    EXPECT_EQ(Eval("complex(1, -2)"), "(1-2j)");
    EXPECT_EQ(Eval("list('abc')"), "['a', 'b', 'c']");
    EXPECT_EQ(Eval("tuple([1])"), "(1,)");
    EXPECT_EQ(Eval("dict([('a', 1)], b=2)"), "{'a': 1, 'b': 2}");
    EXPECT_EQ(Eval("frozenset()"), "frozenset()");
    EXPECT_EQ(Eval("set()"), "set()");
}

TEST(BuiltinsTest, Numbers) {
    EXPECT_EQ(Eval("abs(-5)"), "5");
    EXPECT_EQ(Eval("abs(3 + 4j)"), "5.0");
    EXPECT_EQ(Eval("pow(3, 4, 5)"), "1");
    EXPECT_EQ(Eval("pow(2, -1)"), "0.5");
    EXPECT_EQ(Eval("divmod(-7, 2)"), "(-4, 1)");
    EXPECT_EQ(Eval("round(2.5)"), "2");
    EXPECT_EQ(Eval("round(3.5)"), "4");
    EXPECT_EQ(Eval("round(2.675, 2)"), "2.67");
    EXPECT_EQ(Eval("round(1234, -2)"), "1200");
}

TEST(BuiltinsTest, Isinstance) {
    EXPECT_EQ(Eval("isinstance(1, int)"), "True");
    EXPECT_EQ(Eval("isinstance(True, int)"), "True");
    EXPECT_EQ(Eval("isinstance(1.0, (int, str))"), "False");
}

TEST(MethodsTest, Strings) {
    EXPECT_EQ(Eval("'a,b,,c'.split(',')"), "['a', 'b', '', 'c']");
    EXPECT_EQ(Eval("'  x y  '.split()"), "['x', 'y']");
    EXPECT_EQ(Eval("'-'.join(['1', '2'])"), "'1-2'");
    EXPECT_EQ(Eval("'Hello'.upper()"), "'HELLO'");
    EXPECT_EQ(Eval("'hello world'.title()"), "'Hello World'");
    EXPECT_EQ(Eval("'abcabc'.replace('b', 'B', 1)"), "'aBcabc'");
    EXPECT_EQ(Eval("'abc'.find('z')"), "-1");
    EXPECT_EQ(Eval("'42'.zfill(5)"), "'00042'");
    EXPECT_EQ(Eval("'x'.center(5, '*')"), "'**x**'");
    EXPECT_EQ(Eval("'12'.isdigit()"), "True");
    EXPECT_EQ(Eval("'a=b=c'.partition('=')"), "('a', '=', 'b=c')");
    EXPECT_EQ(Eval("'{} + {x}'.format(1, x=2)"), "'1 + 2'");
    EXPECT_EQ(Eval("'%05.1f|%s' % (3.14159, 'ok')"), "'003.1|ok'");
    EXPECT_EQ(EvalError("'abc'.index('z')"), "ValueError: substring not found");
}

TEST(MethodsTest, Lists) {
    const auto response = mathguard::testing::RunCode(
        "def solve():\n"
        "    xs = [3, 1, 2]\n"
        "    xs.append(4)\n"
        "    xs.extend([5])\n"
        "    xs.insert(0, 9)\n"
        "    last = xs.pop()\n"
        "    xs.remove(1)\n"
        "    xs.sort()\n"
        "    return xs, last, xs.index(3), xs.count(9)\n");
    EXPECT_EQ(response.display, "([2, 3, 4, 9], 5, 1, 1)");
}

TEST(MethodsTest, Dicts) {
    const auto response = mathguard::testing::RunCode(
        "def solve():\n"
        "    d = {'a': 1}\n"
        "    d.setdefault('b', 2)\n"
        "    d.update({'c': 3})\n"
        "    v = d.pop('a')\n"
        "    return list(d.keys()), list(d.values()), list(d.items()), v, d.get('zz')\n");
    EXPECT_EQ(response.display, "(['b', 'c'], [2, 3], [('b', 2), ('c', 3)], 1, None)");
}

TEST(MethodsTest, Sets) {
    EXPECT_EQ(Eval("sorted({1, 2, 3}.union({4}))"), "[1, 2, 3, 4]");
    EXPECT_EQ(Eval("{1, 2, 3} & {2, 3, 4}"), "{2, 3}");
    EXPECT_EQ(Eval("{1, 2}.issubset({1, 2, 3})"), "True");
    EXPECT_EQ(Eval("{1, 2} - {2}"), "{1}");
}

TEST(MethodsTest, Numbers) {
    EXPECT_EQ(Eval("(255).bit_length()"), "8");
    EXPECT_EQ(Eval("(0.5).as_integer_ratio()"), "(1, 2)");
    EXPECT_EQ(Eval("(2.0).is_integer()"), "True");
    EXPECT_EQ(Eval("(3 + 4j).conjugate()"), "(3-4j)");
    EXPECT_EQ(Eval("(3 + 4j).imag"), "4.0");
}
